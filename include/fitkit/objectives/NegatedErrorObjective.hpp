#ifndef FITKIT_NEGATED_ERROR_OBJECTIVE_HPP
#define FITKIT_NEGATED_ERROR_OBJECTIVE_HPP

#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include "fitkit/interfaces/IErrorMeasure.hpp"
#include <memory>

namespace fitkit {

    /**
     * @brief Adapts an error measure to the maximisation convention.
     *
     * evaluate(p) == -error.error(p). This is the only way an IErrorMeasure reaches an
     * optimiser or a WeightedSumObjective; an undefined error (+inf) becomes -inf.
     */
    class NegatedErrorObjective : public IObjectiveFunction {
        public:
            /**
             * @param[in] error The error measure to negate.
             * @throws ConfigurationException If error is null.
             */
            explicit NegatedErrorObjective(std::shared_ptr<const IErrorMeasure> error);

            int getDimension() const override;

            const IErrorMeasure& getErrorMeasure() const { return *error_; }

        protected:
            double calculate(const Eigen::VectorXd& parameters) const override;

        private:
            std::shared_ptr<const IErrorMeasure> error_;
    };

} // namespace fitkit

#endif // FITKIT_NEGATED_ERROR_OBJECTIVE_HPP
