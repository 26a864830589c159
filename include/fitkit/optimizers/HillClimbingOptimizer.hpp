#ifndef FITKIT_HILL_CLIMBING_OPTIMIZER_HPP
#define FITKIT_HILL_CLIMBING_OPTIMIZER_HPP

#include "fitkit/interfaces/IOptimizationAlgorithm.hpp"
#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include "fitkit/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <map>
#include <random>
#include <string>

namespace fitkit {

/**
 * @brief Stochastic hill climbing optimizer with bidirectional search,
 *        step elongation, and binary refinement.
 *
 * This optimizer implements optimization strategies including:
 * - Bidirectional proposal testing (forward and reverse)
 * - Step elongation for successful directions
 * - Binary search refinement
 * - Adaptive step sizing during burn-in, followed by cooling
 * - Periodic restarts from the best point
 * - An optional stall budget that stops the run when the best score stops improving
 *
 * A score of +infinity is accepted as the best possible value and ends the run.
 */
class HillClimbingOptimizer : public IOptimizationAlgorithm {
public:
    /**
     * @brief Default constructor; seeds the generator from std::random_device.
     */
    HillClimbingOptimizer();

    /**
     * @brief Configure optimizer hyperparameters.
     *
     * @param settings Map of configuration parameter names to their values.
     *                 Supported parameters: iterations, initial_step, cooling_rate,
     *                 refinement_steps, burnin_factor, burnin_step_increase,
     *                 post_burnin_step_coef, one_param_step_coef, min_step_coef,
     *                 report_interval, restart_interval, restart_resets_step,
     *                 enable_bidirectional, enable_elongation, max_unchanged_iterations,
     *                 unchanged_threshold, seed.
     */
    void configure(const std::map<std::string, double>& settings) override;

    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager) override;

private:
    // Configuration parameters
    int    iterations_ = 5000;              ///< Maximum number of optimization iterations
    double initial_step_coef_ = 1.0;       ///< Initial step size coefficient
    double cooling_rate_ = 0.995;          ///< Rate at which step size decreases (0 < rate < 1)
    int    refinement_steps_ = 5;          ///< Number of binary refinement steps
    double burnin_factor_ = 0.2;           ///< Fraction of iterations for burn-in phase (0 <= factor <= 1)
    double burnin_step_increase_ = 1.5;    ///< Step size multiplier during burn-in
    double post_burnin_step_coef_ = 1.0;   ///< Step size coefficient after burn-in
    double one_param_step_coef_ = 1.0;     ///< Step size coefficient for single parameter updates
    double min_step_coef_ = 0.01;          ///< Minimum allowed step size coefficient
    int    report_interval_ = 1000;        ///< Interval for progress reporting
    int    restart_interval_ = 0;          ///< Interval for restarts (0 = no restarts)
    bool   restart_resets_step_ = true;    ///< Whether restarts reset the step size
    bool   enable_bidirectional_ = true;   ///< Enable bidirectional search (forward and reverse)
    bool   enable_elongation_ = true;      ///< Enable step elongation for successful directions
    int    max_unchanged_iterations_ = 0;  ///< Stop after this many iterations without improvement (0 = never)
    double unchanged_threshold_ = 1e-11;   ///< Smallest best-score change counted as improvement

    std::mt19937 gen_;  ///< Random number generator for stochastic operations

    struct EvaluationResult {
        Eigen::VectorXd parameters;
        double objective;
        bool valid;
    };

    /**
     * @brief One iteration: propose, try both directions, then elongate and refine.
     */
    EvaluationResult performOptimizedStep(
        const Eigen::VectorXd& currentParams,
        double currentObjective,
        int iteration,
        double stepScale,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager,
        long& evaluations);

    /**
     * @brief Keep stepping along a successful direction while the score improves.
     */
    EvaluationResult elongateStep(
        const Eigen::VectorXd& baseParams,
        const Eigen::VectorXd& stepDirection,
        double baseObjective,
        double stepCoef,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager,
        long& evaluations);

    /**
     * @brief Halve the step repeatedly, trying both signs each time.
     */
    EvaluationResult binaryRefinement(
        const Eigen::VectorXd& baseParams,
        const Eigen::VectorXd& stepDirection,
        double baseObjective,
        double initialStepCoef,
        int numSteps,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager,
        long& evaluations);

    /**
     * @brief Evaluate parameters with constraint checking. NaN scores are invalid.
     */
    EvaluationResult evaluateParameters(
        const Eigen::VectorXd& params,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager,
        long& evaluations);

    Eigen::VectorXd generateStepAll(double stepCoef, const IParameterManager& parameterManager);

    Eigen::VectorXd generateStepOne(double stepCoef, const IParameterManager& parameterManager);
};

} // namespace fitkit

#endif // FITKIT_HILL_CLIMBING_OPTIMIZER_HPP
