#ifndef FITKIT_I_OBJECTIVE_FUNCTION_HPP
#define FITKIT_I_OBJECTIVE_FUNCTION_HPP

#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>

namespace fitkit {

/**
 * @brief Interface for scalar objectives over a fixed-size parameter vector.
 *
 * Objectives follow a maximisation convention: larger scores are better.
 * Scores that are naturally minimised (errors) must be wrapped in
 * NegatedErrorObjective before they are handed to an optimiser.
 *
 * Implementations are immutable once constructed, so evaluate() may be called
 * concurrently on the same instance.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @brief Required length of every parameter vector passed to evaluate().
     * @return int A positive dimension, constant for the lifetime of the object.
     */
    virtual int getDimension() const = 0;

    /**
     * @brief Evaluate the objective at a parameter vector.
     *
     * Out-of-domain intermediate results (e.g. the log of zero) are reported as a
     * signed infinity rather than an exception.
     *
     * @param parameters Vector of length getDimension().
     * @return double The score; may be +inf or -inf.
     * @throws DimensionMismatchException If parameters.size() != getDimension().
     */
    double evaluate(const Eigen::VectorXd& parameters) const {
        if (parameters.size() != getDimension()) {
            FITKIT_THROW_DIMENSION_MISMATCH("IObjectiveFunction::evaluate", getDimension(), static_cast<long>(parameters.size()));
        }
        return calculate(parameters);
    }

protected:
    /**
     * @brief Evaluation rule; only called with vectors of the correct length.
     */
    virtual double calculate(const Eigen::VectorXd& parameters) const = 0;
};

} // namespace fitkit

#endif // FITKIT_I_OBJECTIVE_FUNCTION_HPP
