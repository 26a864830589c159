#include "gtest/gtest.h"
#include "fitkit/problems/Problem.hpp"
#include "fitkit/models/LogisticModel.hpp"
#include "fitkit/models/ActionPotentialModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

using namespace fitkit;
using namespace Eigen;

class ProblemTest : public ::testing::Test {
protected:
    std::shared_ptr<const LogisticModel> model;
    std::vector<double> times;
    std::vector<double> values;

    void SetUp() override {
        model = std::make_shared<LogisticModel>(2.0);
        times = {0.0, 10.0, 20.0, 30.0};
        values = {2.0, 5.0, 12.0, 25.0};
    }
};

TEST_F(ProblemTest, SingleOutputConstruction) {
    Problem problem(model, times, values);

    EXPECT_EQ(problem.getDimension(), 2);
    EXPECT_EQ(problem.getOutputCount(), 1);
    EXPECT_EQ(problem.getTimeCount(), 4u);
    EXPECT_EQ(problem.getTimes(), times);
    ASSERT_EQ(problem.getValues().rows(), 4);
    ASSERT_EQ(problem.getValues().cols(), 1);
    EXPECT_EQ(problem.getValues()(2, 0), 12.0);
    EXPECT_EQ(&problem.getModel(), model.get());
}

TEST_F(ProblemTest, EvaluateSimulatesAtProblemTimes) {
    Problem problem(model, times, values);
    VectorXd p(2);
    p << 0.1, 50.0;

    MatrixXd simulated = problem.evaluate(p);
    EXPECT_TRUE(simulated.isApprox(model->simulate(p, times)));
    EXPECT_THROW(problem.evaluate(VectorXd::Zero(1)), DimensionMismatchException);
}

TEST_F(ProblemTest, MultiOutputShape) {
    auto ap = std::make_shared<ActionPotentialModel>();
    std::vector<double> apTimes = {0.0, 1.0, 2.0};
    Problem problem(ap, apTimes, MatrixXd(MatrixXd::Zero(3, 2)));
    EXPECT_EQ(problem.getDimension(), 5);
    EXPECT_EQ(problem.getOutputCount(), 2);

    EXPECT_THROW(Problem(ap, apTimes, MatrixXd(MatrixXd::Zero(3, 1))), InvalidParameterException);
}

TEST_F(ProblemTest, RejectsInvalidData) {
    EXPECT_THROW(Problem(nullptr, times, values), InvalidParameterException);
    EXPECT_THROW(Problem(model, std::vector<double>{}, std::vector<double>{}), InvalidParameterException);
    EXPECT_THROW(Problem(model, std::vector<double>{-1.0, 0.0}, std::vector<double>{1.0, 1.0}), InvalidParameterException);
    EXPECT_THROW(Problem(model, std::vector<double>{0.0, 2.0, 1.0}, std::vector<double>{1.0, 1.0, 1.0}), InvalidParameterException);
    EXPECT_THROW(Problem(model, times, std::vector<double>{1.0, 2.0}), InvalidParameterException);
}

TEST_F(ProblemTest, AllowsRepeatedTimes) {
    std::vector<double> repeated = {0.0, 1.0, 1.0, 2.0};
    EXPECT_NO_THROW(Problem(model, repeated, values));
}
