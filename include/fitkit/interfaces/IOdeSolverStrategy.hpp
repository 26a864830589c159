#ifndef FITKIT_I_ODE_SOLVER_STRATEGY_HPP
#define FITKIT_I_ODE_SOLVER_STRATEGY_HPP

#include <functional>
#include <vector>

namespace fitkit {

// Type alias for the state vector used internally by Boost.Odeint
using state_type = std::vector<double>;

/**
 * @brief Interface for ODE integration strategies.
 *
 * Defines the contract for numerical integration methods that forward models
 * delegate to.
 */
class IOdeSolverStrategy {
public:
    virtual ~IOdeSolverStrategy() = default;

    /**
     * @brief Integrates the ODE system over specified time points.
     *
     * @param system The function defining the ODE system.
     * @param initial_state The initial state vector; holds the final state on return.
     * @param times The time points at which to record the solution.
     * @param dt_hint An initial step size hint for adaptive solvers.
     * @param observer Called at each output time point with the current state.
     * @param abs_error Absolute error tolerance.
     * @param rel_error Relative error tolerance.
     * @param max_dt Upper bound on the internal step size; 0 leaves it unbounded.
     *
     * @throws SimulationException If integration fails.
     */
    virtual void integrate(
        const std::function<void(const state_type&, state_type&, double)>& system,
        state_type& initial_state,
        const std::vector<double>& times,
        double dt_hint,
        std::function<void(const state_type&, double)> observer,
        double abs_error,
        double rel_error,
        double max_dt = 0.0) const = 0;
};

} // namespace fitkit

#endif // FITKIT_I_ODE_SOLVER_STRATEGY_HPP
