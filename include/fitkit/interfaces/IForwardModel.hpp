#ifndef FITKIT_I_FORWARD_MODEL_HPP
#define FITKIT_I_FORWARD_MODEL_HPP

#include <Eigen/Dense>
#include <vector>

namespace fitkit {

/**
 * @brief Interface for deterministic models that map parameters to a time series.
 *
 * simulate() must be a pure function of its arguments so that objectives built on
 * the model can be evaluated concurrently.
 */
class IForwardModel {
public:
    virtual ~IForwardModel() = default;

    /**
     * @brief Number of parameters accepted by simulate().
     */
    virtual int getParameterCount() const = 0;

    /**
     * @brief Number of observed outputs (columns of the simulated series).
     */
    virtual int getOutputCount() const = 0;

    /**
     * @brief Run the model.
     *
     * @param parameters Vector of length getParameterCount().
     * @param times Non-negative, non-decreasing output times.
     * @return Eigen::MatrixXd Simulated values, one row per time point and one column per output.
     * @throws DimensionMismatchException If parameters has the wrong length.
     * @throws InvalidParameterException If times are invalid for the model.
     * @throws SimulationException If numerical integration fails.
     */
    virtual Eigen::MatrixXd simulate(const Eigen::VectorXd& parameters,
                                     const std::vector<double>& times) const = 0;
};

} // namespace fitkit

#endif // FITKIT_I_FORWARD_MODEL_HPP
