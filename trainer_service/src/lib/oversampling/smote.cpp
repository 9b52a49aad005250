#include "smote.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace fraud_fusion::training {

namespace {

double SquaredDistance(const float* a, const float* b, std::size_t n) {
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return sum;
}

// Brute-force kNN inside the minority class, self excluded. Ties resolve to
// the lower row index.
std::vector<std::vector<std::size_t>> NearestNeighbors(
    const LabeledMatrix& data, const std::vector<std::size_t>& minority, std::size_t k) {

    const auto d = data.NumFeatures();
    std::vector<std::vector<std::size_t>> neighbors(minority.size());
    std::vector<std::pair<double, std::size_t>> candidates;
    candidates.reserve(minority.size());

    for (std::size_t i = 0; i < minority.size(); ++i) {
        candidates.clear();
        const float* row = data.Row(minority[i]);
        for (std::size_t j = 0; j < minority.size(); ++j) {
            if (j == i) continue;
            candidates.emplace_back(SquaredDistance(row, data.Row(minority[j]), d), j);
        }
        std::partial_sort(candidates.begin(), candidates.begin() + k, candidates.end());
        neighbors[i].reserve(k);
        for (std::size_t n = 0; n < k; ++n) {
            neighbors[i].push_back(candidates[n].second);
        }
    }
    return neighbors;
}

} // anonymous namespace

LabeledMatrix Smote(const LabeledMatrix& data, int k_neighbors, uint64_t seed) {
    if (k_neighbors < 1) {
        throw std::invalid_argument("k_neighbors must be positive");
    }
    const std::size_t positives = data.CountLabel(1);
    const std::size_t negatives = data.Rows() - positives;
    const int minority_label = positives <= negatives ? 1 : 0;
    const std::size_t n_min = std::min(positives, negatives);
    const std::size_t n_maj = std::max(positives, negatives);

    if (n_min < 2) {
        throw std::invalid_argument(fmt::format(
            "SMOTE needs at least two minority rows, got {}", n_min));
    }

    LabeledMatrix out = data;
    if (n_min == n_maj) {
        return out;
    }

    std::vector<std::size_t> minority;
    minority.reserve(n_min);
    for (std::size_t i = 0; i < data.Rows(); ++i) {
        if (data.Label(i) == minority_label) minority.push_back(i);
    }

    const std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(k_neighbors), n_min - 1);
    const auto neighbors = NearestNeighbors(data, minority, k);

    const std::size_t to_generate = n_maj - n_min;
    const auto d = data.NumFeatures();
    out.Reserve(data.Rows() + to_generate);

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::size_t> pick_row(0, n_min - 1);
    std::uniform_int_distribution<std::size_t> pick_neighbor(0, k - 1);
    std::uniform_real_distribution<double> gap(0.0, 1.0);

    std::vector<float> synthetic(d);
    for (std::size_t s = 0; s < to_generate; ++s) {
        const std::size_t i = pick_row(rng);
        const std::size_t j = neighbors[i][pick_neighbor(rng)];
        const float* base = data.Row(minority[i]);
        const float* other = data.Row(minority[j]);
        const double g = gap(rng);
        for (std::size_t f = 0; f < d; ++f) {
            synthetic[f] = static_cast<float>(base[f] + g * (static_cast<double>(other[f]) - base[f]));
        }
        out.AppendRow(synthetic.data(), minority_label);
    }

    LOG_INFO() << "SMOTE: " << n_min << " minority rows, k=" << k << ", generated "
               << to_generate << " synthetic rows, " << out.Rows() << " rows total";
    return out;
}

} // namespace fraud_fusion::training
