#include "gtest/gtest.h"
#include "fitkit/models/ActionPotentialModel.hpp"
#include "fitkit/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

using namespace fitkit;
using namespace Eigen;

class ActionPotentialModelTest : public ::testing::Test {
protected:
    ActionPotentialModel model;
};

TEST_F(ActionPotentialModelTest, SuggestedValuesAreConsistent) {
    VectorXd p0 = model.suggestedParameters();
    EXPECT_EQ(p0.size(), model.getParameterCount());
    EXPECT_EQ(model.getOutputCount(), 2);

    std::vector<double> times = model.suggestedTimes();
    ASSERT_EQ(times.size(), 800u);
    for (size_t i = 1; i < times.size(); ++i) {
        EXPECT_GT(times[i], times[i - 1]);
    }
}

TEST_F(ActionPotentialModelTest, SimulateReturnsOneRowPerTime) {
    VectorXd p0 = model.suggestedParameters();
    std::vector<double> times = model.suggestedTimes();
    MatrixXd values = model.simulate(p0, times);

    ASSERT_EQ(values.rows(), static_cast<Index>(times.size()));
    ASSERT_EQ(values.cols(), 2);
    EXPECT_TRUE(values.allFinite());
    EXPECT_DOUBLE_EQ(values(0, 0), -84.622);
    EXPECT_DOUBLE_EQ(values(0, 1), 2e-7);
}

TEST_F(ActionPotentialModelTest, StimulusTriggersUpstroke) {
    MatrixXd values = model.simulate(model.suggestedParameters(), model.suggestedTimes());
    // Resting potential is near -85 mV; the action potential overshoots 0 mV.
    EXPECT_GT(values.col(0).maxCoeff(), 0.0);
    EXPECT_GT(values.col(1).maxCoeff(), 2e-7);
    EXPECT_LT(values(values.rows() - 1, 0), -60.0);
}

TEST_F(ActionPotentialModelTest, RepeatedTimesReuseRows) {
    std::vector<double> times = {0.0, 1.0, 1.0, 5.0};
    MatrixXd values = model.simulate(model.suggestedParameters(), times);
    ASSERT_EQ(values.rows(), 4);
    EXPECT_TRUE(values.row(1) == values.row(2));
}

TEST_F(ActionPotentialModelTest, InitialConditions) {
    VectorXd custom(2);
    custom << -80.0, 1e-5;
    EXPECT_FALSE(model.getInitialConditions() == custom);

    model.setInitialConditions(custom);
    EXPECT_TRUE(model.getInitialConditions() == custom);

    MatrixXd values = model.simulate(model.suggestedParameters(), {0.0, 1.0});
    EXPECT_DOUBLE_EQ(values(0, 0), -80.0);
    EXPECT_DOUBLE_EQ(values(0, 1), 1e-5);
}

TEST_F(ActionPotentialModelTest, RejectsNegativeCalcium) {
    VectorXd negative(2);
    negative << -80.0, -1.0;
    EXPECT_THROW(ActionPotentialModel{negative}, InvalidParameterException);
    EXPECT_THROW(model.setInitialConditions(negative), InvalidParameterException);
    EXPECT_THROW(model.setInitialConditions(VectorXd::Zero(3)), InvalidParameterException);
}

TEST_F(ActionPotentialModelTest, AcceptsExplicitSolver) {
    VectorXd y0(2);
    y0 << -84.622, 2e-7;
    ActionPotentialModel explicitSolver(y0, std::make_shared<Dopri5SolverStrategy>());
    std::vector<double> times = {0.0, 10.0, 50.0};
    MatrixXd a = explicitSolver.simulate(explicitSolver.suggestedParameters(), times);
    MatrixXd b = model.simulate(model.suggestedParameters(), times);
    EXPECT_TRUE(a.isApprox(b, 1e-12));
}

TEST_F(ActionPotentialModelTest, RejectsInvalidSimulationInput) {
    VectorXd p0 = model.suggestedParameters();
    EXPECT_THROW(model.simulate(VectorXd::Zero(4), {0.0, 1.0}), DimensionMismatchException);
    EXPECT_THROW(model.simulate(p0, {}), InvalidParameterException);
    EXPECT_THROW(model.simulate(p0, {0.0, 2.0, 1.0}), InvalidParameterException);
    EXPECT_THROW(model.setSolverTolerances(0.0, 1e-4), InvalidParameterException);
}
