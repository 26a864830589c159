#include "gtest/gtest.h"
#include "fitkit/models/LogisticModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

using namespace fitkit;
using namespace Eigen;

class LogisticModelTest : public ::testing::Test {
protected:
    LogisticModel model{2.0};

    static VectorXd params(double r, double k) {
        VectorXd p(2);
        p << r, k;
        return p;
    }
};

TEST_F(LogisticModelTest, Dimensions) {
    EXPECT_EQ(model.getParameterCount(), 2);
    EXPECT_EQ(model.getOutputCount(), 1);
    EXPECT_EQ(model.getInitialPopulation(), 2.0);
    EXPECT_EQ(model.suggestedParameters().size(), 2);
}

TEST_F(LogisticModelTest, SuggestedTimesIncrease) {
    std::vector<double> times = model.suggestedTimes();
    ASSERT_EQ(times.size(), 100u);
    EXPECT_DOUBLE_EQ(times.front(), 0.0);
    EXPECT_DOUBLE_EQ(times.back(), 100.0);
    for (size_t i = 1; i < times.size(); ++i) {
        EXPECT_GT(times[i], times[i - 1]);
    }
}

TEST_F(LogisticModelTest, StartsAtInitialPopulationAndApproachesCapacity) {
    MatrixXd values = model.simulate(params(0.1, 50.0), {0.0, 1000.0});
    ASSERT_EQ(values.rows(), 2);
    ASSERT_EQ(values.cols(), 1);
    EXPECT_DOUBLE_EQ(values(0, 0), 2.0);
    EXPECT_NEAR(values(1, 0), 50.0, 1e-9);
}

TEST_F(LogisticModelTest, MatchesClosedForm) {
    const double r = 0.015, k = 500.0, t = 120.0;
    MatrixXd values = model.simulate(params(r, k), {t});
    EXPECT_DOUBLE_EQ(values(0, 0), k / (1.0 + (k / 2.0 - 1.0) * std::exp(-r * t)));
}

TEST_F(LogisticModelTest, DegenerateCasesGiveZeros) {
    LogisticModel empty(0.0);
    EXPECT_TRUE(empty.simulate(params(0.1, 50.0), {0.0, 5.0, 10.0}).isZero());
    EXPECT_TRUE(model.simulate(params(0.1, -1.0), {0.0, 5.0}).isZero());
}

TEST_F(LogisticModelTest, RejectsInvalidInput) {
    EXPECT_THROW(LogisticModel(-1.0), InvalidParameterException);
    EXPECT_THROW(LogisticModel(std::numeric_limits<double>::infinity()), InvalidParameterException);
    EXPECT_THROW(model.simulate(params(0.1, 50.0), {-1.0, 0.0}), InvalidParameterException);
    EXPECT_THROW(model.simulate(VectorXd::Zero(3), {0.0}), DimensionMismatchException);
}
