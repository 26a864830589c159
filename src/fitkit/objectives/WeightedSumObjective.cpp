#include "fitkit/objectives/WeightedSumObjective.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>
#include <utility>

namespace fitkit {

    WeightedSumObjective::WeightedSumObjective(std::vector<std::shared_ptr<const IObjectiveFunction>> components)
        : WeightedSumObjective(components, std::vector<double>(components.size(), 1.0)) {}

    WeightedSumObjective::WeightedSumObjective(std::vector<std::shared_ptr<const IObjectiveFunction>> components,
                                               std::vector<double> weights)
        : components_(std::move(components)),
          weights_(std::move(weights))
    {
        const std::string F_NAME = "WeightedSumObjective::WeightedSumObjective";
        if (components_.empty()) {
            FITKIT_THROW_CONFIGURATION_ERROR(F_NAME, "Component list cannot be empty.");
        }
        if (weights_.size() != components_.size()) {
            FITKIT_THROW_CONFIGURATION_ERROR(F_NAME,
                "Number of weights (" + std::to_string(weights_.size()) +
                ") does not match number of components (" + std::to_string(components_.size()) + ").");
        }
        for (size_t i = 0; i < components_.size(); ++i) {
            if (!components_[i]) {
                FITKIT_THROW_CONFIGURATION_ERROR(F_NAME, "Component " + std::to_string(i) + " is null.");
            }
        }

        dimension_ = components_.front()->getDimension();
        for (size_t i = 1; i < components_.size(); ++i) {
            int d = components_[i]->getDimension();
            if (d != dimension_) {
                FITKIT_THROW_CONFIGURATION_ERROR(F_NAME,
                    "All components must have the same dimension. Component 0 has dimension " +
                    std::to_string(dimension_) + ", component " + std::to_string(i) +
                    " has dimension " + std::to_string(d) + ".");
            }
        }
    }

    int WeightedSumObjective::getDimension() const {
        return dimension_;
    }

    size_t WeightedSumObjective::getComponentCount() const {
        return components_.size();
    }

    const std::vector<double>& WeightedSumObjective::getWeights() const {
        return weights_;
    }

    double WeightedSumObjective::calculate(const Eigen::VectorXd& parameters) const {
        double total = 0.0;
        for (size_t i = 0; i < components_.size(); ++i) {
            total += weights_[i] * components_[i]->evaluate(parameters);
        }
        return total;
    }

} // namespace fitkit
