#include "fitkit/objectives/LogRosenbrockObjective.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace fitkit {

    LogRosenbrockObjective::LogRosenbrockObjective(double a, double b)
        : a_(a), b_(b)
    {
        if (!std::isfinite(a_) || !std::isfinite(b_)) {
            FITKIT_THROW_INVALID_PARAM("LogRosenbrockObjective", "Constants a and b must be finite.");
        }
        if (b_ < 0.0) {
            FITKIT_THROW_INVALID_PARAM("LogRosenbrockObjective",
                "Constant b must be non-negative, got " + std::to_string(b_) + ".");
        }
    }

    Eigen::VectorXd LogRosenbrockObjective::getOptimum() const {
        Eigen::VectorXd optimum(2);
        optimum << a_, a_ * a_;
        return optimum;
    }

    double LogRosenbrockObjective::calculate(const Eigen::VectorXd& parameters) const {
        const double x = parameters[0];
        const double y = parameters[1];
        const double inner = (a_ - x) * (a_ - x) + b_ * (y - x * x) * (y - x * x);

        // inner >= 0 since b >= 0; -log(0) is the +inf limit.
        if (inner <= 0.0) {
            return std::numeric_limits<double>::infinity();
        }
        return -std::log(inner);
    }

} // namespace fitkit
