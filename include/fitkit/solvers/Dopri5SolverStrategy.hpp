#ifndef FITKIT_DOPRI5_SOLVER_STRATEGY_HPP
#define FITKIT_DOPRI5_SOLVER_STRATEGY_HPP

#include "fitkit/interfaces/IOdeSolverStrategy.hpp"

namespace fitkit {

/**
 * @brief ODE solver strategy using Boost.Odeint's controlled Dormand-Prince 5(4) stepper.
 *
 * Steps exactly to each requested output time. A non-zero max_dt caps the adaptive
 * step, which keeps short forcing pulses from being stepped over.
 */
class Dopri5SolverStrategy : public IOdeSolverStrategy {
public:
    /**
     * @throws SimulationException If the Boost.Odeint integration fails.
     */
    void integrate(
        const std::function<void(const state_type&, state_type&, double)>& system,
        state_type& initial_state,
        const std::vector<double>& times,
        double dt_hint,
        std::function<void(const state_type&, double)> observer,
        double abs_error,
        double rel_error,
        double max_dt = 0.0) const override;
};

} // namespace fitkit

#endif // FITKIT_DOPRI5_SOLVER_STRATEGY_HPP
