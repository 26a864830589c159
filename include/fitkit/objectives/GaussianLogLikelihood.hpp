#ifndef FITKIT_GAUSSIAN_LOG_LIKELIHOOD_HPP
#define FITKIT_GAUSSIAN_LOG_LIKELIHOOD_HPP

#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include "fitkit/problems/Problem.hpp"
#include <Eigen/Dense>
#include <memory>

namespace fitkit {

    /**
     * @brief Log-likelihood of a problem's data under independent Gaussian noise of known sigma.
     *
     * log L(p) = -N/2 log(2 pi) - N log(sigma) - SS(p) / (2 sigma^2)
     *
     * where N = times x outputs and SS is the sum of squared residuals. This objective
     * is maximised directly; no sign adapter is needed. A failed or NaN simulation
     * yields -infinity.
     */
    class GaussianLogLikelihood : public IObjectiveFunction {
        public:
            /**
             * @param[in] problem The problem whose data are modelled.
             * @param[in] sigma Noise standard deviation.
             * @throws InvalidParameterException If problem is null or sigma is not positive.
             */
            GaussianLogLikelihood(std::shared_ptr<const Problem> problem, double sigma);

            int getDimension() const override;

            double getSigma() const { return sigma_; }

        protected:
            double calculate(const Eigen::VectorXd& parameters) const override;

        private:
            std::shared_ptr<const Problem> problem_;
            double sigma_;
            double offset_;
            double multiplier_;
    };

} // namespace fitkit

#endif // FITKIT_GAUSSIAN_LOG_LIKELIHOOD_HPP
