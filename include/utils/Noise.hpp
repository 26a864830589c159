#ifndef FITKIT_NOISE_HPP
#define FITKIT_NOISE_HPP

#include <Eigen/Dense>

namespace fitkit {

/**
 * @brief Adds independent Gaussian noise to every entry of a matrix of values.
 *
 * Draws from a GSL Mersenne Twister seeded with `seed`, so the same seed always
 * produces the same noisy data.
 *
 * @param values Noise-free values.
 * @param sigma Standard deviation of the noise; 0 returns a copy of values.
 * @param seed Generator seed.
 * @return Eigen::MatrixXd values + N(0, sigma^2) noise.
 * @throws InvalidParameterException If sigma is negative or not finite.
 * @throws std::runtime_error If the GSL generator cannot be allocated.
 */
Eigen::MatrixXd addGaussianNoise(const Eigen::MatrixXd& values, double sigma, unsigned long seed);

} // namespace fitkit

#endif // FITKIT_NOISE_HPP
