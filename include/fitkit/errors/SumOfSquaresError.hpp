#ifndef FITKIT_SUM_OF_SQUARES_ERROR_HPP
#define FITKIT_SUM_OF_SQUARES_ERROR_HPP

#include "fitkit/errors/ProblemErrorMeasure.hpp"
#include <memory>
#include <vector>

namespace fitkit {

    /**
     * @brief Sum of squared residuals between simulated and observed values.
     *
     * e(p) = sum_o w_o * sum_t (sim(t, o) - obs(t, o))^2
     */
    class SumOfSquaresError : public ProblemErrorMeasure {
        public:
            /**
             * @param[in] problem The problem to fit.
             * @param[in] outputWeights One weight per model output; empty means all ones.
             */
            explicit SumOfSquaresError(std::shared_ptr<const Problem> problem,
                                       const std::vector<double>& outputWeights = {});

        protected:
            double calculateError(const Eigen::VectorXd& parameters) const override;
    };

} // namespace fitkit

#endif // FITKIT_SUM_OF_SQUARES_ERROR_HPP
