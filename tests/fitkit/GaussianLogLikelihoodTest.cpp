#include "gtest/gtest.h"
#include "fitkit/objectives/GaussianLogLikelihood.hpp"
#include "fitkit/objectives/WeightedSumObjective.hpp"
#include "fitkit/models/LogisticModel.hpp"
#include "fitkit/problems/Problem.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace fitkit;
using namespace Eigen;

class GaussianLogLikelihoodTest : public ::testing::Test {
protected:
    const double pi = 3.14159265358979323846;
    std::shared_ptr<const LogisticModel> model;
    VectorXd trueParameters;
    std::shared_ptr<const Problem> problem;

    void SetUp() override {
        model = std::make_shared<LogisticModel>(2.0);
        trueParameters = model->suggestedParameters();
        std::vector<double> times = model->suggestedTimes();
        MatrixXd values = (model->simulate(trueParameters, times).array() + 1.0).matrix();
        problem = std::make_shared<Problem>(model, times, values);
    }
};

TEST_F(GaussianLogLikelihoodTest, MatchesClosedForm) {
    const double sigma = 2.0;
    const double n = 100.0;
    GaussianLogLikelihood likelihood(problem, sigma);

    double expected = -0.5 * n * std::log(2.0 * pi) - n * std::log(sigma) - n / (2.0 * sigma * sigma);
    EXPECT_EQ(likelihood.getDimension(), 2);
    EXPECT_DOUBLE_EQ(likelihood.getSigma(), sigma);
    EXPECT_NEAR(likelihood.evaluate(trueParameters), expected, 1e-9);
}

TEST_F(GaussianLogLikelihoodTest, TrueParametersBeatPerturbedOnes) {
    GaussianLogLikelihood likelihood(problem, 1.0);
    VectorXd perturbed = trueParameters;
    perturbed[1] += 5.0;
    EXPECT_GT(likelihood.evaluate(trueParameters), likelihood.evaluate(perturbed));
}

TEST_F(GaussianLogLikelihoodTest, CombinesWithWeightedSum) {
    auto a = std::make_shared<GaussianLogLikelihood>(problem, 1.0);
    auto b = std::make_shared<GaussianLogLikelihood>(problem, 3.0);
    WeightedSumObjective sum({a, b});
    EXPECT_DOUBLE_EQ(sum.evaluate(trueParameters), a->evaluate(trueParameters) + b->evaluate(trueParameters));
}

TEST_F(GaussianLogLikelihoodTest, RejectsInvalidSigma) {
    EXPECT_THROW(GaussianLogLikelihood(problem, 0.0), InvalidParameterException);
    EXPECT_THROW(GaussianLogLikelihood(problem, -1.0), InvalidParameterException);
    EXPECT_THROW(GaussianLogLikelihood(problem, std::numeric_limits<double>::infinity()), InvalidParameterException);
    EXPECT_THROW(GaussianLogLikelihood(nullptr, 1.0), InvalidParameterException);
}

TEST_F(GaussianLogLikelihoodTest, WrongLengthRaisesDimensionMismatch) {
    GaussianLogLikelihood likelihood(problem, 1.0);
    EXPECT_THROW(likelihood.evaluate(VectorXd::Zero(5)), DimensionMismatchException);
}
