#include "stratified_split.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace fraud_fusion::training {

namespace {

// Classes in ascending label order so the generator is consumed the same way
// on every run.
std::map<int, std::vector<std::size_t>> GroupByLabel(const std::vector<int>& labels) {
    std::map<int, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        groups[labels[i]].push_back(i);
    }
    return groups;
}

} // anonymous namespace

SplitIndices StratifiedSplit(const std::vector<int>& labels, double test_fraction, uint64_t seed) {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("test_fraction must lie in (0, 1)");
    }
    std::mt19937_64 rng(seed);
    SplitIndices split;

    for (auto& [label, indices] : GroupByLabel(labels)) {
        std::shuffle(indices.begin(), indices.end(), rng);
        const std::size_t n = indices.size();
        auto n_test = static_cast<std::size_t>(std::llround(test_fraction * static_cast<double>(n)));
        if (n >= 2) {
            n_test = std::clamp<std::size_t>(n_test, 1, n - 1);
        }
        split.test.insert(split.test.end(), indices.begin(), indices.begin() + n_test);
        split.train.insert(split.train.end(), indices.begin() + n_test, indices.end());
    }

    std::sort(split.train.begin(), split.train.end());
    std::sort(split.test.begin(), split.test.end());
    return split;
}

std::vector<std::vector<std::size_t>> StratifiedFolds(const std::vector<int>& labels, int folds) {
    if (folds < 2) {
        throw std::invalid_argument("At least two folds are required");
    }
    std::vector<std::vector<std::size_t>> result(static_cast<std::size_t>(folds));
    for (const auto& [label, indices] : GroupByLabel(labels)) {
        if (indices.size() < static_cast<std::size_t>(folds)) {
            throw std::invalid_argument(fmt::format(
                "Class {} has {} rows, fewer than {} folds", label, indices.size(), folds));
        }
        for (std::size_t i = 0; i < indices.size(); ++i) {
            result[i % folds].push_back(indices[i]);
        }
    }
    for (auto& fold : result) {
        std::sort(fold.begin(), fold.end());
    }
    return result;
}

std::vector<std::size_t> FoldComplement(const std::vector<std::size_t>& fold, std::size_t num_rows) {
    std::vector<bool> held_out(num_rows, false);
    for (auto index : fold) {
        held_out.at(index) = true;
    }
    std::vector<std::size_t> rest;
    rest.reserve(num_rows - fold.size());
    for (std::size_t i = 0; i < num_rows; ++i) {
        if (!held_out[i]) rest.push_back(i);
    }
    return rest;
}

} // namespace fraud_fusion::training
