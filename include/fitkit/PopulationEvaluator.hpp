#ifndef FITKIT_POPULATION_EVALUATOR_HPP
#define FITKIT_POPULATION_EVALUATOR_HPP

#include "fitkit/interfaces/IObjectiveFunction.hpp"
#include <Eigen/Dense>
#include <vector>

namespace fitkit {

/**
 * @brief Evaluate one objective at every candidate of a population.
 *
 * With parallel = true the population is split into contiguous chunks, one per
 * worker, and each chunk is evaluated with std::async. The objective is shared
 * between workers; this relies on evaluate() being free of side effects.
 *
 * @param objective The fully constructed objective.
 * @param candidates Parameter vectors, each of length objective.getDimension().
 * @param parallel Whether to evaluate on several threads.
 * @param maxWorkers Upper bound on the number of workers; 0 uses std::thread::hardware_concurrency().
 * @return std::vector<double> Scores in candidate order.
 * @throws DimensionMismatchException If a candidate has the wrong length (rethrown from its worker).
 */
std::vector<double> evaluatePopulation(const IObjectiveFunction& objective,
                                       const std::vector<Eigen::VectorXd>& candidates,
                                       bool parallel = true,
                                       unsigned int maxWorkers = 0);

} // namespace fitkit

#endif // FITKIT_POPULATION_EVALUATOR_HPP
