#include "fitkit/errors/ProblemErrorMeasure.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace fitkit {

    double weightedSumOfSquares(const Problem& problem,
                                const Eigen::VectorXd& outputWeights,
                                const Eigen::VectorXd& parameters,
                                const std::string& source) {
        Eigen::MatrixXd simulated;
        try {
            simulated = problem.evaluate(parameters);
            const Eigen::MatrixXd& observed = problem.getValues();
            if (simulated.rows() != observed.rows() || simulated.cols() != observed.cols()) {
                FITKIT_THROW_SIMULATION_ERROR(source,
                    "Model returned shape (" + std::to_string(simulated.rows()) + ", " +
                    std::to_string(simulated.cols()) + "), expected (" +
                    std::to_string(observed.rows()) + ", " + std::to_string(observed.cols()) + ").");
            }
        } catch (const SimulationException& e) {
            Logger::getInstance().warning(source, std::string("Simulation failed, reporting +inf: ") + e.what());
            return std::numeric_limits<double>::infinity();
        }

        Eigen::ArrayXXd residuals = (simulated - problem.getValues()).array();
        Eigen::VectorXd perOutput = residuals.square().colwise().sum().transpose().matrix();
        double total = perOutput.dot(outputWeights);

        if (std::isnan(total)) {
            Logger::getInstance().debug(source, "Sum of squares is NaN, reporting +inf.");
            return std::numeric_limits<double>::infinity();
        }
        return total;
    }

    ProblemErrorMeasure::ProblemErrorMeasure(std::shared_ptr<const Problem> problem,
                                             const std::vector<double>& outputWeights,
                                             const std::string& functionName)
        : problem_(std::move(problem))
    {
        if (!problem_) {
            FITKIT_THROW_INVALID_PARAM(functionName, "Problem pointer is null.");
        }
        const int n_outputs = problem_->getOutputCount();
        if (outputWeights.empty()) {
            outputWeights_ = Eigen::VectorXd::Ones(n_outputs);
            return;
        }
        if (static_cast<int>(outputWeights.size()) != n_outputs) {
            FITKIT_THROW_INVALID_PARAM(functionName,
                "Expected " + std::to_string(n_outputs) + " output weights, got " +
                std::to_string(outputWeights.size()) + ".");
        }
        outputWeights_.resize(n_outputs);
        for (int i = 0; i < n_outputs; ++i) {
            if (!(outputWeights[i] >= 0.0)) {
                FITKIT_THROW_INVALID_PARAM(functionName, "Output weights must be non-negative.");
            }
            outputWeights_[i] = outputWeights[i];
        }
    }

    int ProblemErrorMeasure::getDimension() const {
        return problem_->getDimension();
    }

} // namespace fitkit
