#ifndef FITKIT_I_ERROR_MEASURE_HPP
#define FITKIT_I_ERROR_MEASURE_HPP

#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>

namespace fitkit {

/**
 * @brief Interface for error measures, where smaller values are better.
 *
 * Error measures are not objectives. To optimise one, wrap it in a
 * NegatedErrorObjective, which flips the sign into the maximisation convention.
 */
class IErrorMeasure {
public:
    virtual ~IErrorMeasure() = default;

    /**
     * @brief Required length of every parameter vector passed to error().
     */
    virtual int getDimension() const = 0;

    /**
     * @brief Evaluate the error at a parameter vector.
     * @return double Non-negative error for the measures in this library, +inf when undefined.
     * @throws DimensionMismatchException If parameters.size() != getDimension().
     */
    double error(const Eigen::VectorXd& parameters) const {
        if (parameters.size() != getDimension()) {
            FITKIT_THROW_DIMENSION_MISMATCH("IErrorMeasure::error", getDimension(), static_cast<long>(parameters.size()));
        }
        return calculateError(parameters);
    }

protected:
    virtual double calculateError(const Eigen::VectorXd& parameters) const = 0;
};

} // namespace fitkit

#endif // FITKIT_I_ERROR_MEASURE_HPP
