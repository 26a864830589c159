#include "gtest/gtest.h"
#include "fitkit/PopulationEvaluator.hpp"
#include "fitkit/objectives/LogRosenbrockObjective.hpp"
#include "fitkit/objectives/WeightedSumObjective.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <memory>
#include <vector>

using namespace fitkit;
using namespace Eigen;

namespace {

class CountingObjective : public IObjectiveFunction {
public:
    int getDimension() const override { return 2; }
    mutable std::atomic<int> calls{0};

protected:
    double calculate(const VectorXd& parameters) const override {
        ++calls;
        return parameters.sum();
    }
};

} // namespace

class PopulationEvaluatorTest : public ::testing::Test {
protected:
    std::vector<VectorXd> population;

    void SetUp() override {
        for (int i = 0; i < 37; ++i) {
            VectorXd p(2);
            p << 0.05 * i - 1.0, 0.02 * i;
            population.push_back(p);
        }
    }
};

TEST_F(PopulationEvaluatorTest, ParallelMatchesSerial) {
    LogRosenbrockObjective objective;
    std::vector<double> serial = evaluatePopulation(objective, population, false);
    std::vector<double> parallel = evaluatePopulation(objective, population, true, 4);

    ASSERT_EQ(serial.size(), population.size());
    ASSERT_EQ(parallel.size(), population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        EXPECT_EQ(serial[i], parallel[i]) << "candidate " << i;
        EXPECT_EQ(serial[i], objective.evaluate(population[i]));
    }
}

TEST_F(PopulationEvaluatorTest, EvaluatesEachCandidateOnce) {
    CountingObjective objective;
    std::vector<double> scores = evaluatePopulation(objective, population, true, 8);

    EXPECT_EQ(objective.calls.load(), static_cast<int>(population.size()));
    for (size_t i = 0; i < population.size(); ++i) {
        EXPECT_DOUBLE_EQ(scores[i], population[i].sum());
    }
}

TEST_F(PopulationEvaluatorTest, SharedWeightedSumAcrossWorkers) {
    auto rosenbrock = std::make_shared<LogRosenbrockObjective>();
    WeightedSumObjective sum({rosenbrock, rosenbrock}, {1.0, 2.0});
    std::vector<double> scores = evaluatePopulation(sum, population, true, 3);

    for (size_t i = 0; i < population.size(); ++i) {
        EXPECT_DOUBLE_EQ(scores[i], 3.0 * rosenbrock->evaluate(population[i]));
    }
}

TEST_F(PopulationEvaluatorTest, EmptyPopulation) {
    LogRosenbrockObjective objective;
    EXPECT_TRUE(evaluatePopulation(objective, {}).empty());
}

TEST_F(PopulationEvaluatorTest, DimensionErrorIsRethrown) {
    LogRosenbrockObjective objective;
    population[20] = VectorXd::Zero(3);
    EXPECT_THROW(evaluatePopulation(objective, population, true, 4), DimensionMismatchException);
    EXPECT_THROW(evaluatePopulation(objective, population, false), DimensionMismatchException);
}
