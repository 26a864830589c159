#include "gtest/gtest.h"
#include "fitkit/optimizers/HillClimbingOptimizer.hpp"
#include "fitkit/objectives/LogRosenbrockObjective.hpp"
#include "fitkit/objectives/NegatedErrorObjective.hpp"
#include "fitkit/errors/ParabolicError.hpp"
#include "fitkit/parameters/RectangularBoundaries.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <string>

using namespace fitkit;
using namespace Eigen;

namespace {

class FlatObjective : public IObjectiveFunction {
public:
    int getDimension() const override { return 2; }

protected:
    double calculate(const VectorXd&) const override { return 0.0; }
};

class NaNObjective : public IObjectiveFunction {
public:
    int getDimension() const override { return 2; }

protected:
    double calculate(const VectorXd&) const override { return std::numeric_limits<double>::quiet_NaN(); }
};

} // namespace

class HillClimbingOptimizerTest : public ::testing::Test {
protected:
    HillClimbingOptimizer optimizer;
    std::unique_ptr<RectangularBoundaries> bounds;
    std::map<std::string, double> settings;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        bounds = std::make_unique<RectangularBoundaries>(Vector2d(-2.0, -1.0), Vector2d(2.0, 3.0));
        settings = {
            {"iterations", 20000},
            {"cooling_rate", 0.999},
            {"min_step_coef", 0.005},
            {"seed", 42}
        };
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
};

TEST_F(HillClimbingOptimizerTest, ConvergesOnLogRosenbrock) {
    LogRosenbrockObjective objective;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(0.1, 0.1), objective, *bounds);

    ASSERT_EQ(result.bestParameters.size(), 2);
    EXPECT_NEAR(result.bestParameters[0], 1.0, 0.1);
    EXPECT_NEAR(result.bestParameters[1], 1.0, 0.2);
    EXPECT_GT(result.bestObjectiveValue, 4.0);
    EXPECT_GE(result.evaluations, result.iterations);
    EXPECT_DOUBLE_EQ(result.bestObjectiveValue, objective.evaluate(result.bestParameters));
}

TEST_F(HillClimbingOptimizerTest, FindsCentreOfNegatedParabola) {
    VectorXd centre(2);
    centre << 0.5, 1.5;
    NegatedErrorObjective objective(std::make_shared<ParabolicError>(centre));
    settings["iterations"] = 3000;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(-1.5, -0.5), objective, *bounds);

    EXPECT_NEAR(result.bestParameters[0], 0.5, 0.01);
    EXPECT_NEAR(result.bestParameters[1], 1.5, 0.01);
    EXPECT_LE(result.bestObjectiveValue, 0.0);
    EXPECT_GT(result.bestObjectiveValue, -1e-4);
}

TEST_F(HillClimbingOptimizerTest, SameSeedGivesSameResult) {
    LogRosenbrockObjective objective;
    settings["iterations"] = 500;

    HillClimbingOptimizer first;
    HillClimbingOptimizer second;
    first.configure(settings);
    second.configure(settings);

    OptimizationResult a = first.optimize(Vector2d(0.1, 0.1), objective, *bounds);
    OptimizationResult b = second.optimize(Vector2d(0.1, 0.1), objective, *bounds);

    EXPECT_TRUE(a.bestParameters == b.bestParameters);
    EXPECT_EQ(a.bestObjectiveValue, b.bestObjectiveValue);
    EXPECT_EQ(a.evaluations, b.evaluations);
}

TEST_F(HillClimbingOptimizerTest, StopsImmediatelyAtInfiniteScore) {
    LogRosenbrockObjective objective;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(1.0, 1.0), objective, *bounds);

    EXPECT_EQ(result.iterations, 1);
    EXPECT_EQ(result.bestObjectiveValue, std::numeric_limits<double>::infinity());
    EXPECT_TRUE(result.bestParameters == Vector2d(1.0, 1.0));
}

TEST_F(HillClimbingOptimizerTest, StallBudgetEndsRun) {
    FlatObjective objective;
    settings["max_unchanged_iterations"] = 50;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(0.0, 0.0), objective, *bounds);

    EXPECT_EQ(result.iterations, 50);
    EXPECT_EQ(result.bestObjectiveValue, 0.0);
    EXPECT_TRUE(result.bestParameters == Vector2d(0.0, 0.0));
}

TEST_F(HillClimbingOptimizerTest, NaNScoresAreNeverAccepted) {
    NaNObjective objective;
    settings["iterations"] = 100;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(0.5, 0.5), objective, *bounds);

    EXPECT_EQ(result.iterations, 100);
    EXPECT_EQ(result.bestObjectiveValue, -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(result.bestParameters == Vector2d(0.5, 0.5));
}

TEST_F(HillClimbingOptimizerTest, CandidatesStayInsideBounds) {
    VectorXd centre(2);
    centre << 10.0, 10.0;
    NegatedErrorObjective objective(std::make_shared<ParabolicError>(centre));
    settings["iterations"] = 1000;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(0.0, 0.0), objective, *bounds);

    EXPECT_TRUE(bounds->isInside(result.bestParameters));
    EXPECT_NEAR(result.bestParameters[0], 2.0, 1e-9);
    EXPECT_NEAR(result.bestParameters[1], 3.0, 1e-9);
}

TEST_F(HillClimbingOptimizerTest, RejectsInconsistentInput) {
    LogRosenbrockObjective objective;
    optimizer.configure(settings);

    EXPECT_THROW(optimizer.optimize(VectorXd::Zero(3), objective, *bounds), DimensionMismatchException);

    RectangularBoundaries threeBounds(Vector3d(-1.0, -1.0, -1.0), Vector3d(1.0, 1.0, 1.0));
    EXPECT_THROW(optimizer.optimize(Vector2d(0.0, 0.0), objective, threeBounds), DimensionMismatchException);

    EXPECT_THROW(optimizer.optimize(Vector2d(5.0, 0.0), objective, *bounds), InvalidParameterException);
}

TEST_F(HillClimbingOptimizerTest, RejectsOutOfRangeSettings) {
    auto configureWith = [this](const std::string& key, double value) {
        optimizer.configure(std::map<std::string, double>{{key, value}});
    };

    EXPECT_THROW(configureWith("seed", -1.0), InvalidParameterException);
    EXPECT_THROW(configureWith("seed", 1e12), InvalidParameterException);
    EXPECT_THROW(configureWith("iterations", 1e20), InvalidParameterException);
    EXPECT_THROW(configureWith("restart_interval", -1e10), InvalidParameterException);
    EXPECT_THROW(configureWith("cooling_rate", std::numeric_limits<double>::quiet_NaN()), InvalidParameterException);
    EXPECT_THROW(configureWith("max_unchanged_iterations", std::numeric_limits<double>::infinity()),
                 InvalidParameterException);

    EXPECT_NO_THROW(configureWith("seed", 4294967295.0));
}

TEST_F(HillClimbingOptimizerTest, NegativeCountsAreClampedToMinimum) {
    FlatObjective objective;
    settings["iterations"] = -5;
    settings["max_unchanged_iterations"] = -3;
    optimizer.configure(settings);

    OptimizationResult result = optimizer.optimize(Vector2d(0.0, 0.0), objective, *bounds);

    EXPECT_EQ(result.iterations, 1);
}
