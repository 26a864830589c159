#ifndef FITKIT_PARABOLIC_ERROR_HPP
#define FITKIT_PARABOLIC_ERROR_HPP

#include "fitkit/interfaces/IErrorMeasure.hpp"
#include <Eigen/Dense>

namespace fitkit {

    /**
     * @brief Squared distance to a fixed centre: e(p) = sum_i (p_i - c_i)^2.
     */
    class ParabolicError : public IErrorMeasure {
        public:
            /**
             * @param[in] centre The minimum; its length is the dimension.
             * @throws InvalidParameterException If centre is empty.
             */
            explicit ParabolicError(Eigen::VectorXd centre);

            int getDimension() const override { return static_cast<int>(centre_.size()); }

            const Eigen::VectorXd& getCentre() const { return centre_; }

        protected:
            double calculateError(const Eigen::VectorXd& parameters) const override;

        private:
            Eigen::VectorXd centre_;
    };

} // namespace fitkit

#endif // FITKIT_PARABOLIC_ERROR_HPP
