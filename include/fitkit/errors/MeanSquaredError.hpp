#ifndef FITKIT_MEAN_SQUARED_ERROR_HPP
#define FITKIT_MEAN_SQUARED_ERROR_HPP

#include "fitkit/errors/ProblemErrorMeasure.hpp"
#include <memory>
#include <vector>

namespace fitkit {

    /**
     * @brief Weighted sum of squares divided by the number of observations (times x outputs).
     *
     * Unlike SumOfSquaresError, the value does not grow with the sampling density, so
     * problems with different time bases contribute on a comparable scale.
     */
    class MeanSquaredError : public ProblemErrorMeasure {
        public:
            explicit MeanSquaredError(std::shared_ptr<const Problem> problem,
                                      const std::vector<double>& outputWeights = {});

        protected:
            double calculateError(const Eigen::VectorXd& parameters) const override;
    };

} // namespace fitkit

#endif // FITKIT_MEAN_SQUARED_ERROR_HPP
