#include "fitkit/errors/SumOfSquaresError.hpp"
#include "fitkit/errors/MeanSquaredError.hpp"
#include "fitkit/errors/RootMeanSquaredError.hpp"
#include <cmath>
#include <utility>

namespace fitkit {

    SumOfSquaresError::SumOfSquaresError(std::shared_ptr<const Problem> problem,
                                         const std::vector<double>& outputWeights)
        : ProblemErrorMeasure(std::move(problem), outputWeights, "SumOfSquaresError") {}

    double SumOfSquaresError::calculateError(const Eigen::VectorXd& parameters) const {
        return weightedSumOfSquares(*problem_, outputWeights_, parameters, "SumOfSquaresError");
    }

    MeanSquaredError::MeanSquaredError(std::shared_ptr<const Problem> problem,
                                       const std::vector<double>& outputWeights)
        : ProblemErrorMeasure(std::move(problem), outputWeights, "MeanSquaredError") {}

    double MeanSquaredError::calculateError(const Eigen::VectorXd& parameters) const {
        const double n = static_cast<double>(problem_->getTimeCount()) * problem_->getOutputCount();
        return weightedSumOfSquares(*problem_, outputWeights_, parameters, "MeanSquaredError") / n;
    }

    RootMeanSquaredError::RootMeanSquaredError(std::shared_ptr<const Problem> problem)
        : ProblemErrorMeasure(std::move(problem), {}, "RootMeanSquaredError") {}

    double RootMeanSquaredError::calculateError(const Eigen::VectorXd& parameters) const {
        const double n = static_cast<double>(problem_->getTimeCount()) * problem_->getOutputCount();
        return std::sqrt(weightedSumOfSquares(*problem_, outputWeights_, parameters, "RootMeanSquaredError") / n);
    }

} // namespace fitkit
