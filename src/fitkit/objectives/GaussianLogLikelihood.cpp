#include "fitkit/objectives/GaussianLogLikelihood.hpp"
#include "fitkit/errors/ProblemErrorMeasure.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace fitkit {

    const double PI = 3.14159265358979323846;

    GaussianLogLikelihood::GaussianLogLikelihood(std::shared_ptr<const Problem> problem, double sigma)
        : problem_(std::move(problem)), sigma_(sigma)
    {
        if (!problem_) {
            FITKIT_THROW_INVALID_PARAM("GaussianLogLikelihood", "Problem pointer is null.");
        }
        if (!(sigma_ > 0.0) || !std::isfinite(sigma_)) {
            FITKIT_THROW_INVALID_PARAM("GaussianLogLikelihood",
                "Sigma must be a positive finite number, got " + std::to_string(sigma_) + ".");
        }
        const double n = static_cast<double>(problem_->getTimeCount()) * problem_->getOutputCount();
        offset_ = -0.5 * n * std::log(2.0 * PI) - n * std::log(sigma_);
        multiplier_ = 1.0 / (2.0 * sigma_ * sigma_);
    }

    int GaussianLogLikelihood::getDimension() const {
        return problem_->getDimension();
    }

    double GaussianLogLikelihood::calculate(const Eigen::VectorXd& parameters) const {
        const Eigen::VectorXd ones = Eigen::VectorXd::Ones(problem_->getOutputCount());
        const double ss = weightedSumOfSquares(*problem_, ones, parameters, "GaussianLogLikelihood");
        if (std::isinf(ss)) {
            return -std::numeric_limits<double>::infinity();
        }
        return offset_ - multiplier_ * ss;
    }

} // namespace fitkit
