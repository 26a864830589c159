#include "fitkit/errors/RosenbrockError.hpp"
#include "fitkit/errors/ParabolicError.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace fitkit {

    RosenbrockError::RosenbrockError(double a, double b)
        : a_(a), b_(b) {}

    double RosenbrockError::calculateError(const Eigen::VectorXd& parameters) const {
        const double x = parameters[0];
        const double y = parameters[1];
        return (a_ - x) * (a_ - x) + b_ * (y - x * x) * (y - x * x);
    }

    ParabolicError::ParabolicError(Eigen::VectorXd centre)
        : centre_(std::move(centre))
    {
        if (centre_.size() == 0) {
            FITKIT_THROW_INVALID_PARAM("ParabolicError", "Centre must have at least one entry.");
        }
    }

    double ParabolicError::calculateError(const Eigen::VectorXd& parameters) const {
        return (parameters - centre_).squaredNorm();
    }

} // namespace fitkit
