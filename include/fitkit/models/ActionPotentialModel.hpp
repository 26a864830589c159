#ifndef FITKIT_ACTION_POTENTIAL_MODEL_HPP
#define FITKIT_ACTION_POTENTIAL_MODEL_HPP

#include "fitkit/interfaces/IForwardModel.hpp"
#include "fitkit/interfaces/IOdeSolverStrategy.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace fitkit {

/**
 * @class ActionPotentialModel
 * @brief The 1977 Beeler-Reuter model of the mammalian ventricular action potential.
 *
 * Eight states: membrane voltage V (mV), intracellular calcium Cai (mol/L) and the
 * gates m, h, j, d, f, x1. Only V and Cai are observed, so the model has two outputs.
 *
 * Parameters are the maximum conductances (mS/cm^2), in order:
 * gNaBar, gNaC, gCaBar, gK1Bar, gx1Bar.
 *
 * The cell is paced with a 25 uA/cm^2 stimulus lasting 2 ms every 1000 ms. Integration
 * is delegated to an IOdeSolverStrategy with the step size capped at the stimulus length.
 *
 * Reference: Beeler, G.W. and Reuter, H. (1977) Reconstruction of the action potential
 * of ventricular myocardial fibres. J. Physiol. 268, 177-210.
 */
class ActionPotentialModel : public IForwardModel {
public:
    static constexpr int NUM_PARAMETERS = 5;
    static constexpr int NUM_OUTPUTS = 2;
    static constexpr int NUM_STATES = 8;

    /**
     * @brief Model with the default initial conditions V = -84.622 mV, Cai = 2e-7.
     */
    ActionPotentialModel();

    /**
     * @param initialConditions [V0, Cai0].
     * @param solver Integration strategy; a Dopri5SolverStrategy is used when null.
     * @throws InvalidParameterException If initialConditions does not have two entries or Cai0 < 0.
     */
    explicit ActionPotentialModel(const Eigen::VectorXd& initialConditions,
                                  std::shared_ptr<const IOdeSolverStrategy> solver = nullptr);

    int getParameterCount() const override { return NUM_PARAMETERS; }
    int getOutputCount() const override { return NUM_OUTPUTS; }

    /**
     * @brief Simulate V and Cai at the given times.
     *
     * The initial conditions apply at times.front().
     *
     * @throws DimensionMismatchException If parameters.size() != 5.
     * @throws InvalidParameterException If times are empty or decreasing.
     * @throws SimulationException If integration fails.
     */
    Eigen::MatrixXd simulate(const Eigen::VectorXd& parameters,
                             const std::vector<double>& times) const override;

    /** @brief Current [V0, Cai0]. */
    Eigen::VectorXd getInitialConditions() const;

    /**
     * @brief Replace the observed initial conditions.
     * @throws InvalidParameterException If y0 does not have two entries or Cai0 < 0.
     */
    void setInitialConditions(const Eigen::VectorXd& y0);

    /** @brief Absolute and relative tolerances handed to the solver. */
    void setSolverTolerances(double absError, double relError);

    /** @brief Published maximum conductances [4.0, 0.003, 0.09, 0.35, 0.8]. */
    Eigen::VectorXd suggestedParameters() const;

    /** @brief 0, 0.5, ..., 399.5 ms. */
    std::vector<double> suggestedTimes() const;

private:
    void computeDerivatives(const Eigen::VectorXd& parameters, const state_type& state,
                            state_type& derivatives, double time) const;

    std::shared_ptr<const IOdeSolverStrategy> solver_;

    double v0_ = -84.622;
    double cai0_ = 2e-7;

    // Initial conditions of the unobserved gates
    double m0_ = 0.01;
    double h0_ = 0.99;
    double j0_ = 0.98;
    double d0_ = 0.003;
    double f0_ = 0.99;
    double x10_ = 0.0004;

    double cM_ = 1.0;        ///< Membrane capacitance, uF/cm^2.
    double eNa_ = 50.0;      ///< Sodium reversal potential, mV.

    double iStimAmplitude_ = 25.0;
    double iStimPeriod_ = 1000.0;
    double iStimLength_ = 2.0;

    double absError_ = 1e-6;
    double relError_ = 1e-4;
};

} // namespace fitkit

#endif // FITKIT_ACTION_POTENTIAL_MODEL_HPP
