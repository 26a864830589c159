#include "fitkit/PopulationEvaluator.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace fitkit {

std::vector<double> evaluatePopulation(const IObjectiveFunction& objective,
                                       const std::vector<Eigen::VectorXd>& candidates,
                                       bool parallel,
                                       unsigned int maxWorkers) {
    std::vector<double> scores(candidates.size());
    if (candidates.empty()) {
        return scores;
    }

    unsigned int workers = maxWorkers > 0 ? maxWorkers : std::thread::hardware_concurrency();
    workers = std::max(1u, std::min<unsigned int>(workers, static_cast<unsigned int>(candidates.size())));

    if (!parallel || workers == 1) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            scores[i] = objective.evaluate(candidates[i]);
        }
        return scores;
    }

    const size_t chunk = (candidates.size() + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < candidates.size(); begin += chunk) {
        const size_t end = std::min(begin + chunk, candidates.size());
        futures.push_back(std::async(std::launch::async, [&objective, &candidates, &scores, begin, end]() {
            for (size_t i = begin; i < end; ++i) {
                scores[i] = objective.evaluate(candidates[i]);
            }
        }));
    }

    // Wait for every worker before rethrowing, so no task outlives the referenced data.
    for (auto& f : futures) {
        f.wait();
    }
    for (auto& f : futures) {
        f.get();
    }
    return scores;
}

} // namespace fitkit
