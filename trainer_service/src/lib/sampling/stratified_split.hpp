#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fraud_fusion::training {

struct SplitIndices {
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;
};

// Holds out round(test_fraction * n_c) rows of every class c after a seeded
// shuffle. A class with at least two rows keeps one row on each side.
// Both index lists come back sorted.
SplitIndices StratifiedSplit(const std::vector<int>& labels, double test_fraction, uint64_t seed);

// Deterministic stratified k-fold: the i-th row of each class goes to fold
// i % folds. Returns the validation indices of every fold.
std::vector<std::vector<std::size_t>> StratifiedFolds(const std::vector<int>& labels, int folds);

// Complement of `fold` within [0, num_rows).
std::vector<std::size_t> FoldComplement(const std::vector<std::size_t>& fold, std::size_t num_rows);

} // namespace fraud_fusion::training
