#ifndef FITKIT_WEIGHTED_SUM_OBJECTIVE_HPP
#define FITKIT_WEIGHTED_SUM_OBJECTIVE_HPP

#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace fitkit {

    /**
     * @brief Combines several objectives into one through a weighted sum.
     *
     * Each component may close over its own problem, model, time base and noise
     * level; all of them must accept parameter vectors of the same length. The sum
     * is itself an IObjectiveFunction and can be used anywhere a single objective is.
     *
     * Components are evaluated in construction order on every call; nothing is cached.
     * Signed infinities propagate through the sum. Opposite-signed infinities give NaN,
     * which is returned unchanged.
     */
    class WeightedSumObjective : public IObjectiveFunction {
        public:
            /**
             * @brief Constructs a sum with every weight equal to 1.
             *
             * @param[in] components Ordered, non-empty list of component objectives.
             * @throws ConfigurationException If the list is empty, contains a null pointer,
             *         or the components disagree on getDimension().
             */
            explicit WeightedSumObjective(std::vector<std::shared_ptr<const IObjectiveFunction>> components);

            /**
             * @brief Constructs a weighted sum.
             *
             * @param[in] components Ordered, non-empty list of component objectives.
             * @param[in] weights One weight per component, in the same order.
             * @throws ConfigurationException If the list is empty, contains a null pointer,
             *         weights.size() != components.size(), or the components disagree on getDimension().
             */
            WeightedSumObjective(std::vector<std::shared_ptr<const IObjectiveFunction>> components,
                                 std::vector<double> weights);

            int getDimension() const override;

            size_t getComponentCount() const;

            const std::vector<double>& getWeights() const;

        protected:
            /**
             * @brief Returns sum_i weights[i] * components[i].evaluate(parameters).
             */
            double calculate(const Eigen::VectorXd& parameters) const override;

        private:
            std::vector<std::shared_ptr<const IObjectiveFunction>> components_;
            std::vector<double> weights_;
            int dimension_ = 0;
    };

} // namespace fitkit

#endif // FITKIT_WEIGHTED_SUM_OBJECTIVE_HPP
