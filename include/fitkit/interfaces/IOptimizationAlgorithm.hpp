#ifndef FITKIT_I_OPTIMIZATION_ALGORITHM_HPP
#define FITKIT_I_OPTIMIZATION_ALGORITHM_HPP

#include <Eigen/Dense>
#include <limits>
#include <map>
#include <string>

namespace fitkit {

// Forward declarations
class IObjectiveFunction;
class IParameterManager;

/**
 * @brief Structure to hold the results of an optimization run.
 */
struct OptimizationResult {
    Eigen::VectorXd bestParameters;
    double bestObjectiveValue = -std::numeric_limits<double>::infinity();
    long evaluations = 0;  ///< Number of objective evaluations performed.
    int iterations = 0;    ///< Number of iterations actually run.
};

/**
 * @brief Interface for algorithms that maximise an IObjectiveFunction.
 *
 * Algorithms only use getDimension() and evaluate() of the objective.
 */
class IOptimizationAlgorithm {
public:
    virtual ~IOptimizationAlgorithm() = default;

    /**
     * @brief Run the optimization algorithm.
     *
     * @param initialParameters The starting point; must lie inside the boundaries.
     * @param objectiveFunction The objective function to maximise.
     * @param parameterManager The search space (bounds and proposal sigmas).
     * @return OptimizationResult The best parameters found and their score.
     * @throws DimensionMismatchException If the initial guess or the boundaries do not
     *         match objectiveFunction.getDimension().
     * @throws InvalidParameterException If the initial guess is outside the boundaries.
     */
    virtual OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        const IObjectiveFunction& objectiveFunction,
        const IParameterManager& parameterManager) = 0;

    /**
     * @brief Configure algorithm-specific settings.
     * @param settings Map of setting names to values (e.g., "iterations", "seed").
     */
    virtual void configure(const std::map<std::string, double>& settings) = 0;
};

} // namespace fitkit

#endif // FITKIT_I_OPTIMIZATION_ALGORITHM_HPP
