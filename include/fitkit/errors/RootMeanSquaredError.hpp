#ifndef FITKIT_ROOT_MEAN_SQUARED_ERROR_HPP
#define FITKIT_ROOT_MEAN_SQUARED_ERROR_HPP

#include "fitkit/errors/ProblemErrorMeasure.hpp"
#include <memory>

namespace fitkit {

    /**
     * @brief Square root of the unweighted mean squared residual.
     */
    class RootMeanSquaredError : public ProblemErrorMeasure {
        public:
            explicit RootMeanSquaredError(std::shared_ptr<const Problem> problem);

        protected:
            double calculateError(const Eigen::VectorXd& parameters) const override;
    };

} // namespace fitkit

#endif // FITKIT_ROOT_MEAN_SQUARED_ERROR_HPP
