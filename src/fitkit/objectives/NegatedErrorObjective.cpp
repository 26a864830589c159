#include "fitkit/objectives/NegatedErrorObjective.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace fitkit {

    NegatedErrorObjective::NegatedErrorObjective(std::shared_ptr<const IErrorMeasure> error)
        : error_(std::move(error))
    {
        if (!error_) {
            FITKIT_THROW_CONFIGURATION_ERROR("NegatedErrorObjective", "Error measure pointer is null.");
        }
    }

    int NegatedErrorObjective::getDimension() const {
        return error_->getDimension();
    }

    double NegatedErrorObjective::calculate(const Eigen::VectorXd& parameters) const {
        return -error_->error(parameters);
    }

} // namespace fitkit
