#ifndef FITKIT_PROBLEM_ERROR_MEASURE_HPP
#define FITKIT_PROBLEM_ERROR_MEASURE_HPP

#include "fitkit/interfaces/IErrorMeasure.hpp"
#include "fitkit/problems/Problem.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace fitkit {

    /**
     * @brief Weighted sum of squared residuals between a problem's model and its data.
     *
     * sum_o weights[o] * sum_t (simulated(t, o) - observed(t, o))^2
     *
     * A SimulationException raised by the model is logged at WARNING under `source` and
     * reported as +infinity, as is a NaN sum.
     *
     * @throws DimensionMismatchException If parameters has the wrong length.
     */
    double weightedSumOfSquares(const Problem& problem,
                                const Eigen::VectorXd& outputWeights,
                                const Eigen::VectorXd& parameters,
                                const std::string& source);

    /**
     * @brief Base class for error measures defined on a Problem.
     *
     * Holds the problem and one weight per model output (default 1).
     */
    class ProblemErrorMeasure : public IErrorMeasure {
        public:
            int getDimension() const override;

            const Problem& getProblem() const { return *problem_; }
            const Eigen::VectorXd& getOutputWeights() const { return outputWeights_; }

        protected:
            /**
             * @param[in] problem The problem to fit.
             * @param[in] outputWeights One non-negative weight per output; empty means all ones.
             * @param[in] functionName Reported in exception messages.
             * @throws InvalidParameterException If problem is null, or the weights have the
             *         wrong length or a negative entry.
             */
            ProblemErrorMeasure(std::shared_ptr<const Problem> problem,
                                const std::vector<double>& outputWeights,
                                const std::string& functionName);

            std::shared_ptr<const Problem> problem_;
            Eigen::VectorXd outputWeights_;
    };

} // namespace fitkit

#endif // FITKIT_PROBLEM_ERROR_MEASURE_HPP
