#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "dataset/labeled_matrix.hpp"

namespace fraud_fusion::training {

// Fits candidate `candidate` on `train` and returns P(fraud) for every row of
// `validation`.
using FoldScorer = std::function<std::vector<double>(
    std::size_t candidate, const LabeledMatrix& train, const LabeledMatrix& validation)>;

struct SearchResult {
    std::size_t best_candidate = 0;
    double best_score = 0.0;
    // Mean validation AUPRC per evaluated candidate, in `evaluated` order.
    std::vector<std::size_t> evaluated;
    std::vector<double> mean_scores;
};

// Candidates to evaluate out of `total`. Zero iterations, or at least
// `total`, means the whole grid in order; otherwise a seeded draw without
// replacement.
std::vector<std::size_t> SelectCandidates(std::size_t total, int iterations, uint64_t seed);

// Cross-validated AUPRC search over stratified folds. Every (candidate, fold)
// pair runs as its own task on the current task processor. The highest mean
// wins; ties go to the earlier candidate. Must run inside the userver engine.
SearchResult CrossValidatedSearch(const LabeledMatrix& data,
                                  const std::vector<std::size_t>& candidates,
                                  int folds,
                                  const FoldScorer& scorer);

} // namespace fraud_fusion::training
