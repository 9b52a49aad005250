#include "hyperparameter_search.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>

#include <userver/logging/log.hpp>
#include <userver/utils/async.hpp>

#include "metrics/metrics.hpp"
#include "sampling/stratified_split.hpp"

namespace fraud_fusion::training {

std::vector<std::size_t> SelectCandidates(std::size_t total, int iterations, uint64_t seed) {
    std::vector<std::size_t> all(total);
    std::iota(all.begin(), all.end(), 0);
    if (iterations <= 0 || static_cast<std::size_t>(iterations) >= total) {
        return all;
    }
    std::mt19937_64 rng(seed);
    std::shuffle(all.begin(), all.end(), rng);
    all.resize(static_cast<std::size_t>(iterations));
    return all;
}

SearchResult CrossValidatedSearch(const LabeledMatrix& data,
                                  const std::vector<std::size_t>& candidates,
                                  int folds,
                                  const FoldScorer& scorer) {
    if (candidates.empty()) {
        throw std::invalid_argument("Hyperparameter search has no candidates");
    }
    const auto fold_indices = StratifiedFolds(data.Labels(), folds);

    // Fold matrices are shared read-only by every candidate.
    std::vector<LabeledMatrix> train_sets;
    std::vector<LabeledMatrix> validation_sets;
    for (const auto& fold : fold_indices) {
        train_sets.push_back(data.Select(FoldComplement(fold, data.Rows())));
        validation_sets.push_back(data.Select(fold));
    }

    std::vector<userver::engine::TaskWithResult<double>> tasks;
    tasks.reserve(candidates.size() * fold_indices.size());
    for (auto candidate : candidates) {
        for (std::size_t f = 0; f < fold_indices.size(); ++f) {
            tasks.push_back(userver::utils::Async(
                "cv-fold", [&scorer, &train_sets, &validation_sets, candidate, f] {
                    const auto& validation = validation_sets[f];
                    return AveragePrecision(validation.Labels(),
                                            scorer(candidate, train_sets[f], validation));
                }));
        }
    }

    SearchResult result;
    result.evaluated = candidates;
    result.mean_scores.reserve(candidates.size());
    std::size_t task_index = 0;
    for (std::size_t c = 0; c < candidates.size(); ++c) {
        double sum = 0.0;
        for (std::size_t f = 0; f < fold_indices.size(); ++f) {
            sum += tasks[task_index++].Get();
        }
        const double mean = sum / static_cast<double>(fold_indices.size());
        result.mean_scores.push_back(mean);
        LOG_INFO() << "Candidate " << candidates[c] << ": mean AUPRC " << mean;

        if (c == 0 || mean > result.best_score) {
            result.best_candidate = candidates[c];
            result.best_score = mean;
        }
    }
    return result;
}

} // namespace fraud_fusion::training
