#include "utils/Noise.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

namespace fitkit {

Eigen::MatrixXd addGaussianNoise(const Eigen::MatrixXd& values, double sigma, unsigned long seed) {
    if (!std::isfinite(sigma) || sigma < 0.0) {
        FITKIT_THROW_INVALID_PARAM("addGaussianNoise",
            "Noise standard deviation must be finite and non-negative, got " + std::to_string(sigma));
    }

    Eigen::MatrixXd noisy = values;
    if (sigma == 0.0) {
        return noisy;
    }

    gsl_rng* rng = gsl_rng_alloc(gsl_rng_mt19937);
    if (!rng) {
        throw std::runtime_error("Failed to allocate GSL RNG.");
    }
    gsl_rng_set(rng, seed);

    for (Eigen::Index j = 0; j < noisy.cols(); ++j) {
        for (Eigen::Index i = 0; i < noisy.rows(); ++i) {
            noisy(i, j) += gsl_ran_gaussian(rng, sigma);
        }
    }

    gsl_rng_free(rng);
    return noisy;
}

} // namespace fitkit
