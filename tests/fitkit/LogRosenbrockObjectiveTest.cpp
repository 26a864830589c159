#include "gtest/gtest.h"
#include "fitkit/objectives/LogRosenbrockObjective.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>

using namespace fitkit;
using namespace Eigen;

class LogRosenbrockObjectiveTest : public ::testing::Test {
protected:
    LogRosenbrockObjective objective{1.0, 100.0};

    static VectorXd point(double x, double y) {
        VectorXd p(2);
        p << x, y;
        return p;
    }
};

TEST_F(LogRosenbrockObjectiveTest, HasTwoParameters) {
    EXPECT_EQ(objective.getDimension(), 2);
    EXPECT_EQ(objective.getA(), 1.0);
    EXPECT_EQ(objective.getB(), 100.0);
}

TEST_F(LogRosenbrockObjectiveTest, OriginScoresZero) {
    EXPECT_DOUBLE_EQ(objective.evaluate(point(0.0, 0.0)), 0.0);
}

TEST_F(LogRosenbrockObjectiveTest, KnownValueNearOrigin) {
    // inner = 0.81 + 100 * 0.0081 = 1.62
    EXPECT_NEAR(objective.evaluate(point(0.1, 0.1)), -0.4824, 1e-4);
    EXPECT_DOUBLE_EQ(objective.evaluate(point(0.1, 0.1)), -std::log(1.62));
}

TEST_F(LogRosenbrockObjectiveTest, OptimumIsPositiveInfinity) {
    double value = objective.evaluate(point(1.0, 1.0));
    EXPECT_TRUE(std::isinf(value));
    EXPECT_GT(value, 0.0);
}

TEST_F(LogRosenbrockObjectiveTest, OptimumFollowsConstants) {
    LogRosenbrockObjective shifted(2.0, 10.0);
    VectorXd optimum = shifted.getOptimum();
    ASSERT_EQ(optimum.size(), 2);
    EXPECT_DOUBLE_EQ(optimum[0], 2.0);
    EXPECT_DOUBLE_EQ(optimum[1], 4.0);
    EXPECT_EQ(shifted.evaluate(optimum), std::numeric_limits<double>::infinity());
}

TEST_F(LogRosenbrockObjectiveTest, ScoreIncreasesTowardsOptimum) {
    double far = objective.evaluate(point(-1.5, 2.5));
    double mid = objective.evaluate(point(0.5, 0.25));
    double near = objective.evaluate(point(0.99, 0.98));
    EXPECT_LT(far, mid);
    EXPECT_LT(mid, near);
}

TEST_F(LogRosenbrockObjectiveTest, WrongLengthRaisesDimensionMismatch) {
    EXPECT_THROW(objective.evaluate(VectorXd::Zero(1)), DimensionMismatchException);
    EXPECT_THROW(objective.evaluate(VectorXd::Zero(3)), DimensionMismatchException);
}

TEST_F(LogRosenbrockObjectiveTest, RejectsInvalidConstants) {
    EXPECT_THROW(LogRosenbrockObjective(1.0, -1.0), InvalidParameterException);
    EXPECT_THROW(LogRosenbrockObjective(std::numeric_limits<double>::quiet_NaN(), 100.0), InvalidParameterException);
    EXPECT_THROW(LogRosenbrockObjective(1.0, std::numeric_limits<double>::infinity()), InvalidParameterException);
}
