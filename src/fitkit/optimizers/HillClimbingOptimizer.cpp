#include "fitkit/optimizers/HillClimbingOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace fitkit {

HillClimbingOptimizer::HillClimbingOptimizer()
    : gen_{std::random_device{}()} {}

void HillClimbingOptimizer::configure(const std::map<std::string, double>& settings) {
    const std::string F_NAME = "HillClimbingOptimizer::configure";
    for (const auto& kv : settings) {
        if (!std::isfinite(kv.second)) {
            FITKIT_THROW_INVALID_PARAM(F_NAME, "Setting '" + kv.first + "' must be finite.");
        }
    }

    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };
    // Integer settings must fit in an int before the cast.
    auto getInt = [&](const std::string& key, int def) {
        double value = get(key, def);
        if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
            value > static_cast<double>(std::numeric_limits<int>::max())) {
            FITKIT_THROW_INVALID_PARAM(F_NAME, "Setting '" + key + "' is out of range: " + std::to_string(value));
        }
        return static_cast<int>(value);
    };

    iterations_               = getInt("iterations", iterations_);
    initial_step_coef_        = get("initial_step", initial_step_coef_);
    cooling_rate_             = get("cooling_rate", cooling_rate_);
    refinement_steps_         = getInt("refinement_steps", refinement_steps_);
    burnin_factor_            = get("burnin_factor", burnin_factor_);
    burnin_step_increase_     = get("burnin_step_increase", burnin_step_increase_);
    post_burnin_step_coef_    = get("post_burnin_step_coef", post_burnin_step_coef_);
    one_param_step_coef_      = get("one_param_step_coef", one_param_step_coef_);
    min_step_coef_            = get("min_step_coef", min_step_coef_);
    report_interval_          = getInt("report_interval", report_interval_);
    restart_interval_         = getInt("restart_interval", restart_interval_);
    restart_resets_step_      = get("restart_resets_step", restart_resets_step_ ? 1.0 : 0.0) != 0.0;
    enable_bidirectional_     = get("enable_bidirectional", enable_bidirectional_ ? 1.0 : 0.0) != 0.0;
    enable_elongation_        = get("enable_elongation", enable_elongation_ ? 1.0 : 0.0) != 0.0;
    max_unchanged_iterations_ = getInt("max_unchanged_iterations", max_unchanged_iterations_);
    unchanged_threshold_      = get("unchanged_threshold", unchanged_threshold_);

    auto seed = settings.find("seed");
    if (seed != settings.end()) {
        if (seed->second < 0.0 || seed->second > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
            FITKIT_THROW_INVALID_PARAM(F_NAME, "Seed must lie in [0, 4294967295], got " + std::to_string(seed->second));
        }
        gen_.seed(static_cast<std::mt19937::result_type>(seed->second));
    }

    // Validate parameters
    iterations_               = std::max(iterations_, 1);
    initial_step_coef_        = std::max(initial_step_coef_, 1e-6);
    cooling_rate_             = std::clamp(cooling_rate_, 0.001, 0.9999);
    refinement_steps_         = std::max(refinement_steps_, 0);
    burnin_factor_            = std::clamp(burnin_factor_, 0.0, 1.0);
    min_step_coef_            = std::max(min_step_coef_, 1e-12);
    report_interval_          = std::max(report_interval_, 1);
    restart_interval_         = std::max(restart_interval_, 0);
    max_unchanged_iterations_ = std::max(max_unchanged_iterations_, 0);
    unchanged_threshold_      = std::max(unchanged_threshold_, 0.0);

    Logger::getInstance().info("HillClimbingOptimizer",
        "Configured with iterations=" + std::to_string(iterations_) +
        ", bidirectional=" + std::to_string(enable_bidirectional_) +
        ", elongation=" + std::to_string(enable_elongation_) +
        ", refinement_steps=" + std::to_string(refinement_steps_) +
        ", max_unchanged_iterations=" + std::to_string(max_unchanged_iterations_));
}

OptimizationResult HillClimbingOptimizer::optimize(
    const Eigen::VectorXd& initialParameters,
    const IObjectiveFunction& objectiveFunction,
    const IParameterManager& parameterManager) {

    const std::string F_NAME = "HillClimbingOptimizer::optimize";
    const int dimension = objectiveFunction.getDimension();
    if (initialParameters.size() != dimension) {
        FITKIT_THROW_DIMENSION_MISMATCH(F_NAME, dimension, static_cast<long>(initialParameters.size()));
    }
    if (static_cast<long>(parameterManager.getParameterCount()) != dimension) {
        FITKIT_THROW_DIMENSION_MISMATCH(F_NAME, dimension, static_cast<long>(parameterManager.getParameterCount()));
    }
    if (!parameterManager.isInside(initialParameters)) {
        FITKIT_THROW_INVALID_PARAM(F_NAME, "Initial parameters lie outside the boundaries.");
    }

    Logger::getInstance().info(F_NAME, "Starting optimization with " +
                              std::to_string(iterations_) + " iterations");

    OptimizationResult result;
    result.bestParameters = initialParameters;
    result.bestObjectiveValue = objectiveFunction.evaluate(initialParameters);
    result.evaluations = 1;

    if (std::isnan(result.bestObjectiveValue)) {
        Logger::getInstance().warning(F_NAME, "Invalid initial objective value");
        result.bestObjectiveValue = -std::numeric_limits<double>::infinity();
    }

    Eigen::VectorXd current = initialParameters;
    double currentObjective = result.bestObjectiveValue;
    double stepCoef = initial_step_coef_;
    int burnin_iters = static_cast<int>(iterations_ * burnin_factor_);
    int accepted = 0;
    int improved = 0;
    int unchanged = 0;

    for (int iter = 1; iter <= iterations_; ++iter) {
        result.iterations = iter;

        if (restart_interval_ > 0 && iter % restart_interval_ == 0) {
            Logger::getInstance().debug(F_NAME, "Restarting from best parameters at iteration " +
                                     std::to_string(iter));
            current = result.bestParameters;
            currentObjective = result.bestObjectiveValue;
            if (restart_resets_step_) {
                stepCoef = initial_step_coef_;
            }
        }

        auto stepResult = performOptimizedStep(
            current, currentObjective, iter, stepCoef, objectiveFunction, parameterManager, result.evaluations);

        bool bestImproved = false;
        if (stepResult.valid && stepResult.objective > currentObjective) {
            current = stepResult.parameters;
            currentObjective = stepResult.objective;
            accepted++;

            if (currentObjective > result.bestObjectiveValue) {
                bestImproved = std::abs(currentObjective - result.bestObjectiveValue) >= unchanged_threshold_;
                result.bestObjectiveValue = currentObjective;
                result.bestParameters = current;
                improved++;
                Logger::getInstance().debug(F_NAME,
                    "New best at iteration " + std::to_string(iter) +
                    ": " + std::to_string(currentObjective));
            }
        }

        if (iter > burnin_iters) {
            stepCoef = std::max(stepCoef * cooling_rate_, min_step_coef_);
        }

        if (iter % report_interval_ == 0 || iter == iterations_) {
            double acceptRate = 100.0 * accepted / iter;
            Logger::getInstance().info(F_NAME,
                "Iteration " + std::to_string(iter) + "/" + std::to_string(iterations_) +
                ", Current: " + std::to_string(currentObjective) +
                ", Best: " + std::to_string(result.bestObjectiveValue) +
                ", Accept rate: " + std::to_string(acceptRate) + "%" +
                ", Step coef: " + std::to_string(stepCoef));
        }

        if (std::isinf(result.bestObjectiveValue) && result.bestObjectiveValue > 0.0) {
            Logger::getInstance().info(F_NAME, "Reached a score of +inf at iteration " + std::to_string(iter) + ".");
            break;
        }

        unchanged = bestImproved ? 0 : unchanged + 1;
        if (max_unchanged_iterations_ > 0 && unchanged >= max_unchanged_iterations_) {
            Logger::getInstance().info(F_NAME, "No significant improvement for " +
                std::to_string(unchanged) + " iterations, stopping at iteration " + std::to_string(iter) + ".");
            break;
        }
    }

    Logger::getInstance().info(F_NAME,
        "Optimization complete. Accepted: " + std::to_string(accepted) + "/" +
        std::to_string(result.iterations) + ", Improved: " + std::to_string(improved) +
        ", Evaluations: " + std::to_string(result.evaluations));

    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::performOptimizedStep(
    const Eigen::VectorXd& currentParams,
    double currentObjective,
    int iteration,
    double stepScale,
    const IObjectiveFunction& objectiveFunction,
    const IParameterManager& parameterManager,
    long& evaluations) {

    int burnin_iters = static_cast<int>(iterations_ * burnin_factor_);
    bool in_burnin = iteration <= burnin_iters;

    double stepCoef;
    Eigen::VectorXd stepDirection;

    if (in_burnin || iteration % 2 == 0) {
        stepCoef = in_burnin ? burnin_step_increase_ : post_burnin_step_coef_;
        stepDirection = generateStepAll(1.0, parameterManager);
    } else {
        stepCoef = one_param_step_coef_;
        stepDirection = generateStepOne(1.0, parameterManager);
    }
    stepCoef *= stepScale;

    Eigen::VectorXd candidateParams = currentParams + stepCoef * stepDirection;
    auto forwardResult = evaluateParameters(candidateParams, objectiveFunction, parameterManager, evaluations);

    EvaluationResult bestResult = forwardResult;
    bool improved = forwardResult.valid && forwardResult.objective > currentObjective;

    if (enable_bidirectional_ && !improved) {
        candidateParams = currentParams - stepCoef * stepDirection;
        auto reverseResult = evaluateParameters(candidateParams, objectiveFunction, parameterManager, evaluations);

        if (reverseResult.valid && reverseResult.objective > currentObjective) {
            bestResult = reverseResult;
            stepDirection = -stepDirection;
            improved = true;
        }
    }

    if (improved) {
        if (enable_elongation_) {
            auto elongResult = elongateStep(
                bestResult.parameters, stepDirection, bestResult.objective,
                stepCoef, objectiveFunction, parameterManager, evaluations);

            if (elongResult.valid && elongResult.objective > bestResult.objective) {
                bestResult = elongResult;
            }
        }

        if (refinement_steps_ > 0) {
            auto refineResult = binaryRefinement(
                bestResult.parameters, stepDirection, bestResult.objective,
                stepCoef, refinement_steps_, objectiveFunction, parameterManager, evaluations);

            if (refineResult.valid && refineResult.objective > bestResult.objective) {
                bestResult = refineResult;
            }
        }
    }

    return bestResult;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::elongateStep(
    const Eigen::VectorXd& baseParams,
    const Eigen::VectorXd& stepDirection,
    double baseObjective,
    double stepCoef,
    const IObjectiveFunction& objectiveFunction,
    const IParameterManager& parameterManager,
    long& evaluations) {

    EvaluationResult result{baseParams, baseObjective, true};

    while (true) {
        Eigen::VectorXd extendedParams = result.parameters + stepCoef * stepDirection;
        auto extendedResult = evaluateParameters(extendedParams, objectiveFunction, parameterManager, evaluations);

        if (extendedResult.valid && extendedResult.objective > result.objective) {
            result = extendedResult;
        } else {
            break;
        }
    }

    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::binaryRefinement(
    const Eigen::VectorXd& baseParams,
    const Eigen::VectorXd& stepDirection,
    double baseObjective,
    double initialStepCoef,
    int numSteps,
    const IObjectiveFunction& objectiveFunction,
    const IParameterManager& parameterManager,
    long& evaluations) {

    EvaluationResult result{baseParams, baseObjective, true};
    double alpha = initialStepCoef;

    for (int k = 0; k < numSteps; ++k) {
        alpha *= 0.5;

        for (int sign : {-1, 1}) {
            Eigen::VectorXd refinedParams = result.parameters + sign * alpha * stepDirection;
            auto refinedResult = evaluateParameters(refinedParams, objectiveFunction, parameterManager, evaluations);

            if (refinedResult.valid && refinedResult.objective > result.objective) {
                result = refinedResult;
            }
        }
    }

    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::evaluateParameters(
    const Eigen::VectorXd& params,
    const IObjectiveFunction& objectiveFunction,
    const IParameterManager& parameterManager,
    long& evaluations) {

    Eigen::VectorXd constrainedParams = parameterManager.applyConstraints(params);

    double objective = objectiveFunction.evaluate(constrainedParams);
    ++evaluations;

    bool valid = !std::isnan(objective);
    if (!valid) {
        objective = -std::numeric_limits<double>::infinity();
    }

    return {constrainedParams, objective, valid};
}

Eigen::VectorXd HillClimbingOptimizer::generateStepAll(
    double stepCoef, const IParameterManager& parameterManager) {

    size_t paramCount = parameterManager.getParameterCount();
    Eigen::VectorXd steps(paramCount);

    for (size_t i = 0; i < paramCount; ++i) {
        double sigma = parameterManager.getSigmaForParamIndex(static_cast<int>(i));
        std::normal_distribution<> dist(0.0, sigma * stepCoef);
        steps[i] = dist(gen_);
    }

    return steps;
}

Eigen::VectorXd HillClimbingOptimizer::generateStepOne(
    double stepCoef, const IParameterManager& parameterManager) {

    size_t paramCount = parameterManager.getParameterCount();
    Eigen::VectorXd steps = Eigen::VectorXd::Zero(paramCount);

    if (paramCount > 0) {
        std::uniform_int_distribution<> idxDist(0, static_cast<int>(paramCount) - 1);
        int idx = idxDist(gen_);

        double sigma = parameterManager.getSigmaForParamIndex(idx);
        std::normal_distribution<> dist(0.0, sigma * stepCoef);
        steps[idx] = dist(gen_);
    }

    return steps;
}

} // namespace fitkit
