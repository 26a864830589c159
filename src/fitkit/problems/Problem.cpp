#include "fitkit/problems/Problem.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>
#include <utility>

namespace fitkit {

namespace {

    Eigen::MatrixXd toColumn(const std::vector<double>& values) {
        Eigen::MatrixXd column(static_cast<Eigen::Index>(values.size()), 1);
        for (size_t i = 0; i < values.size(); ++i) {
            column(static_cast<Eigen::Index>(i), 0) = values[i];
        }
        return column;
    }

} // namespace

Problem::Problem(std::shared_ptr<const IForwardModel> model,
                 std::vector<double> times,
                 Eigen::MatrixXd values)
    : model_(std::move(model)),
      times_(std::move(times)),
      values_(std::move(values))
{
    const std::string F_NAME = "Problem::Problem";
    if (!model_) {
        FITKIT_THROW_INVALID_PARAM(F_NAME, "Model pointer is null.");
    }
    if (times_.empty()) {
        FITKIT_THROW_INVALID_PARAM(F_NAME, "Time points vector is empty.");
    }
    if (times_.front() < 0.0) {
        FITKIT_THROW_INVALID_PARAM(F_NAME, "Times cannot be negative.");
    }
    for (size_t i = 1; i < times_.size(); ++i) {
        if (times_[i] < times_[i - 1]) {
            FITKIT_THROW_INVALID_PARAM(F_NAME, "Times must be non-decreasing. Found " +
                std::to_string(times_[i]) + " after " + std::to_string(times_[i - 1]) + ".");
        }
    }
    if (values_.rows() != static_cast<Eigen::Index>(times_.size()) ||
        values_.cols() != model_->getOutputCount()) {
        FITKIT_THROW_INVALID_PARAM(F_NAME,
            "Values must have shape (" + std::to_string(times_.size()) + ", " +
            std::to_string(model_->getOutputCount()) + "), got (" +
            std::to_string(values_.rows()) + ", " + std::to_string(values_.cols()) + ").");
    }
}

Problem::Problem(std::shared_ptr<const IForwardModel> model,
                 std::vector<double> times,
                 const std::vector<double>& values)
    : Problem(std::move(model), std::move(times), toColumn(values)) {}

Eigen::MatrixXd Problem::evaluate(const Eigen::VectorXd& parameters) const {
    if (parameters.size() != getDimension()) {
        FITKIT_THROW_DIMENSION_MISMATCH("Problem::evaluate", getDimension(), static_cast<long>(parameters.size()));
    }
    return model_->simulate(parameters, times_);
}

int Problem::getDimension() const {
    return model_->getParameterCount();
}

int Problem::getOutputCount() const {
    return model_->getOutputCount();
}

size_t Problem::getTimeCount() const {
    return times_.size();
}

const std::vector<double>& Problem::getTimes() const {
    return times_;
}

const Eigen::MatrixXd& Problem::getValues() const {
    return values_;
}

const IForwardModel& Problem::getModel() const {
    return *model_;
}

} // namespace fitkit
