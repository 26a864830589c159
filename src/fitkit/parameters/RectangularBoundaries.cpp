#include "fitkit/parameters/RectangularBoundaries.hpp"
#include "exceptions/Exceptions.hpp"
#include <stdexcept>

namespace fitkit {

RectangularBoundaries::RectangularBoundaries(const Eigen::VectorXd& lower,
                                             const Eigen::VectorXd& upper,
                                             const Eigen::VectorXd& sigmas)
    : lower_(lower), upper_(upper)
{
    if (lower_.size() == 0) {
        FITKIT_THROW_INVALID_PARAM("RectangularBoundaries", "Bounds cannot be empty.");
    }
    if (lower_.size() != upper_.size()) {
        FITKIT_THROW_INVALID_PARAM("RectangularBoundaries",
            "Lower and upper bounds must have the same length: " + std::to_string(lower_.size()) +
            " vs " + std::to_string(upper_.size()));
    }
    for (Eigen::Index i = 0; i < lower_.size(); ++i) {
        if (!(lower_[i] < upper_[i])) {
            FITKIT_THROW_INVALID_PARAM("RectangularBoundaries",
                "Lower bound must be strictly below upper bound for parameter " + std::to_string(i) + ".");
        }
    }

    if (sigmas.size() == 0) {
        sigmas_ = (upper_ - lower_) / 6.0;
    } else {
        if (sigmas.size() != lower_.size()) {
            FITKIT_THROW_INVALID_PARAM("RectangularBoundaries",
                "Expected " + std::to_string(lower_.size()) + " sigmas, got " + std::to_string(sigmas.size()));
        }
        if (!(sigmas.array() > 0.0).all()) {
            FITKIT_THROW_INVALID_PARAM("RectangularBoundaries", "Proposal sigmas must be positive.");
        }
        sigmas_ = sigmas;
    }
}

RectangularBoundaries RectangularBoundaries::fromBoundsMap(
    const std::vector<std::string>& names,
    const std::map<std::string, std::pair<double, double>>& bounds) {

    Eigen::VectorXd lower(static_cast<Eigen::Index>(names.size()));
    Eigen::VectorXd upper(static_cast<Eigen::Index>(names.size()));
    for (size_t i = 0; i < names.size(); ++i) {
        auto it = bounds.find(names[i]);
        if (it == bounds.end()) {
            FITKIT_THROW_INVALID_PARAM("RectangularBoundaries::fromBoundsMap",
                "No bounds given for parameter '" + names[i] + "'.");
        }
        lower[static_cast<Eigen::Index>(i)] = it->second.first;
        upper[static_cast<Eigen::Index>(i)] = it->second.second;
    }
    return RectangularBoundaries(lower, upper);
}

size_t RectangularBoundaries::getParameterCount() const {
    return static_cast<size_t>(lower_.size());
}

void RectangularBoundaries::checkIndex(int idx, const char* functionName) const {
    if (idx < 0 || idx >= lower_.size()) {
        throw std::out_of_range(std::string("[RectangularBoundaries] Index out of bounds in ") +
                                functionName + ": " + std::to_string(idx));
    }
}

double RectangularBoundaries::getSigmaForParamIndex(int index) const {
    checkIndex(index, "getSigmaForParamIndex");
    return sigmas_[index];
}

double RectangularBoundaries::getLowerBoundForParamIndex(int idx) const {
    checkIndex(idx, "getLowerBoundForParamIndex");
    return lower_[idx];
}

double RectangularBoundaries::getUpperBoundForParamIndex(int idx) const {
    checkIndex(idx, "getUpperBoundForParamIndex");
    return upper_[idx];
}

Eigen::VectorXd RectangularBoundaries::applyConstraints(const Eigen::VectorXd& parameters) const {
    if (parameters.size() != lower_.size()) {
        FITKIT_THROW_DIMENSION_MISMATCH("RectangularBoundaries::applyConstraints",
            static_cast<long>(lower_.size()), static_cast<long>(parameters.size()));
    }
    return parameters.cwiseMax(lower_).cwiseMin(upper_);
}

bool RectangularBoundaries::isInside(const Eigen::VectorXd& parameters) const {
    if (parameters.size() != lower_.size()) {
        FITKIT_THROW_DIMENSION_MISMATCH("RectangularBoundaries::isInside",
            static_cast<long>(lower_.size()), static_cast<long>(parameters.size()));
    }
    return (parameters.array() >= lower_.array()).all() && (parameters.array() <= upper_.array()).all();
}

} // namespace fitkit
