#include "fitkit/models/ActionPotentialModel.hpp"
#include "fitkit/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace fitkit {

ActionPotentialModel::ActionPotentialModel()
    : solver_(std::make_shared<Dopri5SolverStrategy>()) {}

ActionPotentialModel::ActionPotentialModel(const Eigen::VectorXd& initialConditions,
                                           std::shared_ptr<const IOdeSolverStrategy> solver)
    : solver_(std::move(solver))
{
    if (!solver_) {
        solver_ = std::make_shared<Dopri5SolverStrategy>();
    }
    setInitialConditions(initialConditions);
}

Eigen::VectorXd ActionPotentialModel::getInitialConditions() const {
    Eigen::VectorXd y0(2);
    y0 << v0_, cai0_;
    return y0;
}

void ActionPotentialModel::setInitialConditions(const Eigen::VectorXd& y0) {
    if (y0.size() != 2) {
        FITKIT_THROW_INVALID_PARAM("ActionPotentialModel::setInitialConditions",
            "Expected initial conditions [V, Cai], got " + std::to_string(y0.size()) + " values.");
    }
    if (y0[1] < 0.0) {
        FITKIT_THROW_INVALID_PARAM("ActionPotentialModel::setInitialConditions",
            "Initial condition of Cai cannot be negative.");
    }
    v0_ = y0[0];
    cai0_ = y0[1];
}

void ActionPotentialModel::setSolverTolerances(double absError, double relError) {
    if (absError <= 0.0 || relError <= 0.0) {
        FITKIT_THROW_INVALID_PARAM("ActionPotentialModel::setSolverTolerances",
            "Tolerances must be positive. Received: abs=" + std::to_string(absError) +
            ", rel=" + std::to_string(relError));
    }
    absError_ = absError;
    relError_ = relError;
}

Eigen::VectorXd ActionPotentialModel::suggestedParameters() const {
    Eigen::VectorXd p(NUM_PARAMETERS);
    p << 4.0, 0.003, 0.09, 0.35, 0.8;
    return p;
}

std::vector<double> ActionPotentialModel::suggestedTimes() const {
    std::vector<double> times;
    times.reserve(800);
    for (int i = 0; i < 800; ++i) {
        times.push_back(0.5 * i);
    }
    return times;
}

void ActionPotentialModel::computeDerivatives(const Eigen::VectorXd& parameters, const state_type& state,
                                              state_type& derivatives, double time) const {
    const double V = state[0];
    const double Cai = state[1];
    const double m = state[2];
    const double h = state[3];
    const double j = state[4];
    const double d = state[5];
    const double f = state[6];
    const double x1 = state[7];

    const double gNaBar = parameters[0];
    const double gNaC = parameters[1];
    const double gCaBar = parameters[2];
    const double gK1Bar = parameters[3];
    const double gx1Bar = parameters[4];

    // Fast sodium current
    const double INa = (gNaBar * m * m * m * h * j + gNaC) * (V - eNa_);
    double alpha = (V + 47.0) / (1.0 - std::exp(-0.1 * (V + 47.0)));
    double beta = 40.0 * std::exp(-0.056 * (V + 72.0));
    const double dm = alpha * (1.0 - m) - beta * m;
    alpha = 0.126 * std::exp(-0.25 * (V + 77.0));
    beta = 1.7 / (1.0 + std::exp(-0.082 * (V + 22.5)));
    const double dh = alpha * (1.0 - h) - beta * h;
    alpha = 0.055 * std::exp(-0.25 * (V + 78.0)) / (1.0 + std::exp(-0.2 * (V + 78.0)));
    beta = 0.3 / (1.0 + std::exp(-0.1 * (V + 32.0)));
    const double dj = alpha * (1.0 - j) - beta * j;

    // Slow inward calcium current
    const double ECa = -82.3 - 13.0287 * std::log(Cai);
    const double ICa = gCaBar * d * f * (V - ECa);
    alpha = 0.095 * std::exp(-0.01 * (V - 5.0)) / (std::exp(-0.072 * (V - 5.0)) + 1.0);
    beta = 0.07 * std::exp(-0.017 * (V + 44.0)) / (std::exp(0.05 * (V + 44.0)) + 1.0);
    const double dd = alpha * (1.0 - d) - beta * d;
    alpha = 0.012 * std::exp(-0.008 * (V + 28.0)) / (std::exp(0.15 * (V + 28.0)) + 1.0);
    beta = 0.0065 * std::exp(-0.02 * (V + 30.0)) / (std::exp(-0.2 * (V + 30.0)) + 1.0);
    const double df = alpha * (1.0 - f) - beta * f;

    const double dCai = -1e-7 * ICa + 0.07 * (1e-7 - Cai);

    // Time-independent potassium current
    const double IK1 = gK1Bar * (
        4.0 * (std::exp(0.04 * (V + 85.0)) - 1.0)
            / (std::exp(0.08 * (V + 53.0)) + std::exp(0.04 * (V + 53.0)))
        + 0.2 * (V + 23.0) / (1.0 - std::exp(-0.04 * (V + 23.0))));

    // Time-dependent outward current
    const double Ix1 = gx1Bar * x1 * (std::exp(0.04 * (V + 77.0)) - 1.0) / std::exp(0.04 * (V + 35.0));
    alpha = 0.0005 * std::exp(0.083 * (V + 50.0)) / (std::exp(0.057 * (V + 50.0)) + 1.0);
    beta = 0.0013 * std::exp(-0.06 * (V + 20.0)) / (std::exp(-0.04 * (V + 333.0)) + 1.0);
    const double dx1 = alpha * (1.0 - x1) - beta * x1;

    const double IStim = std::fmod(time, iStimPeriod_) < iStimLength_ ? iStimAmplitude_ : 0.0;

    const double dV = -(1.0 / cM_) * (IK1 + Ix1 + INa + ICa - IStim);

    derivatives[0] = dV;
    derivatives[1] = dCai;
    derivatives[2] = dm;
    derivatives[3] = dh;
    derivatives[4] = dj;
    derivatives[5] = dd;
    derivatives[6] = df;
    derivatives[7] = dx1;
}

Eigen::MatrixXd ActionPotentialModel::simulate(const Eigen::VectorXd& parameters,
                                               const std::vector<double>& times) const {
    const std::string F_NAME = "ActionPotentialModel::simulate";
    if (parameters.size() != NUM_PARAMETERS) {
        FITKIT_THROW_DIMENSION_MISMATCH(F_NAME, NUM_PARAMETERS, static_cast<long>(parameters.size()));
    }
    if (times.empty()) {
        FITKIT_THROW_INVALID_PARAM(F_NAME, "Output time points vector cannot be empty.");
    }

    // Odeint needs strictly increasing times; repeated times reuse the previous row.
    std::vector<double> unique_times;
    std::vector<size_t> row_source(times.size());
    unique_times.reserve(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        if (!unique_times.empty() && times[i] < unique_times.back()) {
            FITKIT_THROW_INVALID_PARAM(F_NAME,
                "Output time points must be non-decreasing. Found " + std::to_string(times[i]) +
                " after " + std::to_string(unique_times.back()) + ".");
        }
        if (unique_times.empty() || times[i] > unique_times.back()) {
            unique_times.push_back(times[i]);
        }
        row_source[i] = unique_times.size() - 1;
    }

    state_type state = {v0_, cai0_, m0_, h0_, j0_, d0_, f0_, x10_};

    auto system_function = [this, &parameters](const state_type& x, state_type& dxdt, double t) {
        computeDerivatives(parameters, x, dxdt, t);
    };

    std::vector<state_type> raw_solution;
    raw_solution.reserve(unique_times.size());
    auto observer = [&raw_solution](const state_type& x, double) {
        raw_solution.push_back(x);
    };

    if (unique_times.size() == 1) {
        raw_solution.push_back(state);
    } else {
        solver_->integrate(system_function, state, unique_times, 0.01, observer,
                           absError_, relError_, iStimLength_);
    }

    if (raw_solution.size() != unique_times.size()) {
        FITKIT_THROW_SIMULATION_ERROR(F_NAME, "Solution/timepoint count mismatch.");
    }

    Eigen::MatrixXd values(static_cast<Eigen::Index>(times.size()), NUM_OUTPUTS);
    for (size_t i = 0; i < times.size(); ++i) {
        const state_type& x = raw_solution[row_source[i]];
        values(static_cast<Eigen::Index>(i), 0) = x[0];
        values(static_cast<Eigen::Index>(i), 1) = x[1];
    }
    return values;
}

} // namespace fitkit
