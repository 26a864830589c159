#include "fitkit/models/LogisticModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>

namespace fitkit {

LogisticModel::LogisticModel(double initialPopulation)
    : p0_(initialPopulation)
{
    if (!std::isfinite(p0_) || p0_ < 0.0) {
        FITKIT_THROW_INVALID_PARAM("LogisticModel::LogisticModel",
            "Initial population must be a finite, non-negative number. Received: " + std::to_string(p0_));
    }
}

Eigen::MatrixXd LogisticModel::simulate(const Eigen::VectorXd& parameters,
                                        const std::vector<double>& times) const {
    if (parameters.size() != getParameterCount()) {
        FITKIT_THROW_DIMENSION_MISMATCH("LogisticModel::simulate", getParameterCount(), static_cast<long>(parameters.size()));
    }
    for (double t : times) {
        if (t < 0.0) {
            FITKIT_THROW_INVALID_PARAM("LogisticModel::simulate",
                "Negative times are not allowed. Received: " + std::to_string(t));
        }
    }

    const double r = parameters[0];
    const double k = parameters[1];
    Eigen::MatrixXd values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(times.size()), 1);

    if (p0_ == 0.0 || k < 0.0) {
        return values;
    }
    for (size_t i = 0; i < times.size(); ++i) {
        values(static_cast<Eigen::Index>(i), 0) = k / (1.0 + (k / p0_ - 1.0) * std::exp(-r * times[i]));
    }
    return values;
}

Eigen::VectorXd LogisticModel::suggestedParameters() const {
    Eigen::VectorXd p(2);
    p << 0.1, 50.0;
    return p;
}

std::vector<double> LogisticModel::suggestedTimes() const {
    const int n = 100;
    std::vector<double> times(n);
    for (int i = 0; i < n; ++i) {
        times[i] = 100.0 * i / (n - 1);
    }
    return times;
}

} // namespace fitkit
