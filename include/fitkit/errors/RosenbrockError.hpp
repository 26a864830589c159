#ifndef FITKIT_ROSENBROCK_ERROR_HPP
#define FITKIT_ROSENBROCK_ERROR_HPP

#include "fitkit/interfaces/IErrorMeasure.hpp"

namespace fitkit {

    /**
     * @brief The two-dimensional Rosenbrock function as an error measure.
     *
     * e(x, y) = (a - x)^2 + b * (y - x^2)^2, minimal (zero) at (a, a^2).
     */
    class RosenbrockError : public IErrorMeasure {
        public:
            explicit RosenbrockError(double a = 1.0, double b = 100.0);

            int getDimension() const override { return 2; }

        protected:
            double calculateError(const Eigen::VectorXd& parameters) const override;

        private:
            double a_;
            double b_;
    };

} // namespace fitkit

#endif // FITKIT_ROSENBROCK_ERROR_HPP
