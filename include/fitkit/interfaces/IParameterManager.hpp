#ifndef FITKIT_I_PARAMETER_MANAGER_HPP
#define FITKIT_I_PARAMETER_MANAGER_HPP

#include <Eigen/Dense>
#include <cstddef>

namespace fitkit {

/**
 * @brief Interface for the search-space description an optimiser works within.
 */
class IParameterManager {
public:
    virtual ~IParameterManager() = default;

    /**
     * @brief Get the number of parameters being managed.
     * @return size_t
     */
    virtual size_t getParameterCount() const = 0;

    /**
     * @brief Get the proposal standard deviation (sigma) for a specific parameter index.
     * Used by optimization algorithms to generate steps.
     * @param index The index of the parameter.
     * @return double The standard deviation (sigma).
     */
    virtual double getSigmaForParamIndex(int index) const = 0;

    /**
     * @brief Map a parameter vector into the feasible region.
     * @param parameters Vector to constrain.
     * @return Eigen::VectorXd The constrained parameter vector.
     */
    virtual Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const = 0;

    /**
     * @brief Whether a parameter vector lies inside the feasible region.
     */
    virtual bool isInside(const Eigen::VectorXd& parameters) const = 0;

    virtual double getLowerBoundForParamIndex(int idx) const = 0;

    virtual double getUpperBoundForParamIndex(int idx) const = 0;
};

} // namespace fitkit

#endif // FITKIT_I_PARAMETER_MANAGER_HPP
