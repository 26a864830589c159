#ifndef FITKIT_LOGISTIC_MODEL_HPP
#define FITKIT_LOGISTIC_MODEL_HPP

#include "fitkit/interfaces/IForwardModel.hpp"
#include <Eigen/Dense>
#include <vector>

namespace fitkit {

/**
 * @class LogisticModel
 * @brief Closed-form logistic population growth.
 *
 * p(t) = K / (1 + (K / p0 - 1) * exp(-r * t))
 *
 * Parameters are [r, K]: the growth rate and the carrying capacity. The initial
 * population p0 is fixed at construction. The model has a single output.
 */
class LogisticModel : public IForwardModel {
public:
    /**
     * @param initialPopulation The population p0 at t = 0.
     * @throws InvalidParameterException If initialPopulation is negative or not finite.
     */
    explicit LogisticModel(double initialPopulation = 2.0);

    int getParameterCount() const override { return 2; }
    int getOutputCount() const override { return 1; }

    /**
     * @brief Evaluate the closed form at each time.
     *
     * Returns zeros when p0 == 0 or K < 0.
     *
     * @throws DimensionMismatchException If parameters.size() != 2.
     * @throws InvalidParameterException If any time is negative.
     */
    Eigen::MatrixXd simulate(const Eigen::VectorXd& parameters,
                             const std::vector<double>& times) const override;

    double getInitialPopulation() const { return p0_; }

    /** @brief A growth rate and carrying capacity suitable for examples: [0.1, 50]. */
    Eigen::VectorXd suggestedParameters() const;

    /** @brief 100 evenly spaced times on [0, 100]. */
    std::vector<double> suggestedTimes() const;

private:
    double p0_;
};

} // namespace fitkit

#endif // FITKIT_LOGISTIC_MODEL_HPP
