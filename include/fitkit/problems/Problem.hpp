#ifndef FITKIT_PROBLEM_HPP
#define FITKIT_PROBLEM_HPP

#include "fitkit/interfaces/IForwardModel.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace fitkit {

/**
 * @class Problem
 * @brief Binds a forward model to a set of time points and observed values.
 *
 * Data-fit error measures and likelihoods close over a Problem. Each Problem has its
 * own time base, so several problems on different sampling grids can be combined in
 * one WeightedSumObjective. The observed data are copied at construction and never
 * changed afterwards.
 */
class Problem {
public:
    /**
     * @param model The forward model.
     * @param times Non-empty, non-negative, non-decreasing time points.
     * @param values Observations, one row per time point and one column per model output.
     * @throws InvalidParameterException If model is null, times are invalid, or values
     *         does not have shape times.size() x model->getOutputCount().
     */
    Problem(std::shared_ptr<const IForwardModel> model,
            std::vector<double> times,
            Eigen::MatrixXd values);

    /**
     * @brief Single-output convenience constructor.
     * @throws InvalidParameterException As above, or if the model has more than one output.
     */
    Problem(std::shared_ptr<const IForwardModel> model,
            std::vector<double> times,
            const std::vector<double>& values);

    /**
     * @brief Simulate the model at this problem's time points.
     * @throws DimensionMismatchException If parameters.size() != getDimension().
     * @throws SimulationException If the model fails to integrate.
     */
    Eigen::MatrixXd evaluate(const Eigen::VectorXd& parameters) const;

    int getDimension() const;
    int getOutputCount() const;
    size_t getTimeCount() const;
    const std::vector<double>& getTimes() const;
    const Eigen::MatrixXd& getValues() const;
    const IForwardModel& getModel() const;

private:
    std::shared_ptr<const IForwardModel> model_;
    std::vector<double> times_;
    Eigen::MatrixXd values_;
};

} // namespace fitkit

#endif // FITKIT_PROBLEM_HPP
