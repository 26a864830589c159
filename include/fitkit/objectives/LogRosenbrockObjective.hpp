#ifndef FITKIT_LOG_ROSENBROCK_OBJECTIVE_HPP
#define FITKIT_LOG_ROSENBROCK_OBJECTIVE_HPP

#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include <Eigen/Dense>

namespace fitkit {

    /**
     * @brief Negative logarithm of the two-dimensional Rosenbrock function.
     *
     * f(x, y) = -log((a - x)^2 + b * (y - x^2)^2)
     *
     * The maximum is at (a, a^2), where the inner expression is exactly zero and
     * the score is +infinity.
     */
    class LogRosenbrockObjective : public IObjectiveFunction {
        public:
            /**
             * @param[in] a Location constant.
             * @param[in] b Valley steepness; must be non-negative.
             * @throws InvalidParameterException If b < 0.
             */
            explicit LogRosenbrockObjective(double a = 1.0, double b = 100.0);

            int getDimension() const override { return 2; }

            double getA() const { return a_; }
            double getB() const { return b_; }

            /**
             * @brief The point (a, a^2) at which the score is +infinity.
             */
            Eigen::VectorXd getOptimum() const;

        protected:
            double calculate(const Eigen::VectorXd& parameters) const override;

        private:
            double a_;
            double b_;
    };

} // namespace fitkit

#endif // FITKIT_LOG_ROSENBROCK_OBJECTIVE_HPP
