#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "fitkit/errors/SumOfSquaresError.hpp"
#include "fitkit/models/LogisticModel.hpp"
#include "fitkit/objectives/LogRosenbrockObjective.hpp"
#include "fitkit/objectives/NegatedErrorObjective.hpp"
#include "fitkit/objectives/WeightedSumObjective.hpp"
#include "fitkit/optimizers/HillClimbingOptimizer.hpp"
#include "fitkit/parameters/RectangularBoundaries.hpp"
#include "fitkit/problems/Problem.hpp"
#include "utils/Logger.hpp"
#include "utils/Noise.hpp"
#include "utils/ReadOptimizationConfiguration.hpp"
#include "exceptions/Exceptions.hpp"

using namespace Eigen;
using namespace fitkit;

namespace {

std::string formatVector(const VectorXd& v) {
    std::string s = "[";
    for (Index i = 0; i < v.size(); ++i) {
        s += (i ? ", " : "") + std::to_string(v[i]);
    }
    return s + "]";
}

std::vector<double> linspace(double start, double stop, int n) {
    std::vector<double> points(n);
    for (int i = 0; i < n; ++i) {
        points[i] = start + (stop - start) * i / (n - 1);
    }
    return points;
}

std::shared_ptr<const Problem> makeNoisyProblem(const std::shared_ptr<const LogisticModel>& model,
                                                const VectorXd& trueParameters,
                                                std::vector<double> times,
                                                double noise,
                                                unsigned long seed) {
    MatrixXd values = addGaussianNoise(model->simulate(trueParameters, times), noise, seed);
    return std::make_shared<Problem>(model, std::move(times), std::move(values));
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting objective function demo...");

    try {
        std::map<std::string, double> settings = {{"iterations", 5000}, {"seed", 1}};
        if (argc > 1) {
            for (const auto& kv : readSettingsFile(argv[1])) {
                settings[kv.first] = kv.second;
            }
        }

        // --- Analytic objective ---
        auto rosenbrock = std::make_shared<LogRosenbrockObjective>(1.0, 100.0);
        Vector2d lower(-2.0, -1.0);
        Vector2d upper(2.0, 3.0);
        RectangularBoundaries rosenbrockBounds(lower, upper);

        HillClimbingOptimizer optimizer;
        optimizer.configure(settings);
        OptimizationResult analytic = optimizer.optimize(Vector2d(0.1, 0.1), *rosenbrock, rosenbrockBounds);
        Logger::getInstance().info("main", "Log-Rosenbrock best point " + formatVector(analytic.bestParameters) +
                                   ", score " + std::to_string(analytic.bestObjectiveValue));

        // --- Two data sets, different time bases and noise levels, one objective ---
        auto logistic = std::make_shared<const LogisticModel>(2.0);
        Vector2d trueParameters(0.015, 500.0);

        auto problemA = makeNoisyProblem(logistic, trueParameters, linspace(0.0, 1000.0, 100), 50.0, 11);
        auto problemB = makeNoisyProblem(logistic, trueParameters, linspace(0.0, 600.0, 60), 10.0, 12);

        auto errorA = std::make_shared<NegatedErrorObjective>(std::make_shared<SumOfSquaresError>(problemA));
        auto errorB = std::make_shared<NegatedErrorObjective>(std::make_shared<SumOfSquaresError>(problemB));
        WeightedSumObjective combined({errorA, errorB}, {1.0, 1.0});

        RectangularBoundaries logisticBounds(Vector2d(0.001, 100.0), Vector2d(0.05, 1000.0));
        OptimizationResult fit = optimizer.optimize(Vector2d(0.01, 450.0), combined, logisticBounds);

        Logger::getInstance().info("main", "True parameters " + formatVector(trueParameters) +
                                   ", score " + std::to_string(combined.evaluate(trueParameters)));
        Logger::getInstance().info("main", "Fitted parameters " + formatVector(fit.bestParameters) +
                                   ", score " + std::to_string(fit.bestObjectiveValue));

    } catch (const FitkitException& e) {
        Logger::getInstance().fatal("main", std::string("Demo failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().fatal("main", std::string("Unexpected error: ") + e.what());
        return 1;
    }

    Logger::getInstance().info("main", "Demo completed.");
    return 0;
}
