#include "isolation_forest_trainer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

#include <userver/logging/log.hpp>
#include <userver/utils/async.hpp>

namespace fraud_fusion::training {

namespace {

class TreeBuilder {
public:
    TreeBuilder(const std::vector<float>& rows, std::size_t num_features, int height_limit, uint64_t seed)
        : rows_(rows), num_features_(num_features), height_limit_(height_limit), rng_(seed) {}

    int Build(std::vector<std::size_t> sample, int depth) {
        const int id = tree_.nodes_size();
        auto* node = tree_.add_nodes();
        node->set_feature(-1);
        node->set_size(static_cast<int64_t>(sample.size()));

        if (depth >= height_limit_ || sample.size() <= 1) {
            return id;
        }

        // Only features that still vary inside this node can split it.
        std::vector<int> splittable;
        std::vector<std::pair<float, float>> ranges(num_features_);
        for (std::size_t f = 0; f < num_features_; ++f) {
            float lo = std::numeric_limits<float>::max();
            float hi = std::numeric_limits<float>::lowest();
            for (auto r : sample) {
                const float v = Value(r, f);
                lo = std::min(lo, v);
                hi = std::max(hi, v);
            }
            ranges[f] = {lo, hi};
            if (hi > lo) splittable.push_back(static_cast<int>(f));
        }
        if (splittable.empty()) {
            return id;
        }

        std::uniform_int_distribution<std::size_t> pick(0, splittable.size() - 1);
        const int feature = splittable[pick(rng_)];
        const auto [lo, hi] = ranges[static_cast<std::size_t>(feature)];
        std::uniform_real_distribution<double> uniform(lo, hi);
        auto threshold = static_cast<float>(uniform(rng_));
        if (threshold <= lo) {
            threshold = std::nextafter(lo, hi);
        }

        std::vector<std::size_t> left;
        std::vector<std::size_t> right;
        for (auto r : sample) {
            (Value(r, static_cast<std::size_t>(feature)) < threshold ? left : right).push_back(r);
        }
        sample.clear();
        sample.shrink_to_fit();

        const int left_id = Build(std::move(left), depth + 1);
        const int right_id = Build(std::move(right), depth + 1);

        // add_nodes may have reallocated; re-fetch.
        auto* parent = tree_.mutable_nodes(id);
        parent->set_feature(feature);
        parent->set_threshold(threshold);
        parent->set_left(left_id);
        parent->set_right(right_id);
        return id;
    }

    std::vector<std::size_t> Subsample(std::size_t total, std::size_t size) {
        std::vector<std::size_t> indices(total);
        std::iota(indices.begin(), indices.end(), 0);
        if (size < total) {
            std::shuffle(indices.begin(), indices.end(), rng_);
            indices.resize(size);
        }
        return indices;
    }

    models::IsolationTree Release() { return std::move(tree_); }

private:
    float Value(std::size_t row, std::size_t feature) const {
        return rows_[row * num_features_ + feature];
    }

    const std::vector<float>& rows_;
    std::size_t num_features_;
    int height_limit_;
    std::mt19937_64 rng_;
    models::IsolationTree tree_;
};

} // anonymous namespace

models::IsolationTree BuildIsolationTree(const std::vector<float>& rows,
                                         std::size_t num_features,
                                         std::size_t sample_size,
                                         uint64_t seed) {
    const std::size_t total = rows.size() / num_features;
    const int height_limit = static_cast<int>(std::ceil(std::log2(std::max<std::size_t>(sample_size, 2))));
    TreeBuilder builder(rows, num_features, height_limit, seed);
    builder.Build(builder.Subsample(total, sample_size), 0);
    return builder.Release();
}

double Quantile(std::vector<double> values, double quantile) {
    if (values.empty()) {
        throw std::invalid_argument("Quantile of an empty set");
    }
    std::sort(values.begin(), values.end());
    const double pos = quantile * static_cast<double>(values.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(pos));
    const auto upper = std::min(lower + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lower);
    return values[lower] + frac * (values[upper] - values[lower]);
}

IsolationForestModel FitIsolationForest(const std::vector<float>& rows,
                                        std::size_t num_features,
                                        const std::vector<std::string_view>& feature_names,
                                        const IsolationForestParams& params) {
    if (num_features == 0 || feature_names.size() != num_features || rows.size() % num_features != 0) {
        throw std::invalid_argument("Isolation forest input does not match the feature names");
    }
    const std::size_t total = rows.size() / num_features;
    if (total < 2) {
        throw std::invalid_argument("Isolation forest needs at least two rows");
    }
    const std::size_t sample_size = std::min<std::size_t>(static_cast<std::size_t>(params.max_samples), total);

    std::vector<userver::engine::TaskWithResult<models::IsolationTree>> tasks;
    tasks.reserve(static_cast<std::size_t>(params.n_estimators));
    for (int t = 0; t < params.n_estimators; ++t) {
        const uint64_t tree_seed = params.seed + static_cast<uint64_t>(t);
        tasks.push_back(userver::utils::Async("isolation-tree", [&rows, num_features, sample_size, tree_seed] {
            return BuildIsolationTree(rows, num_features, sample_size, tree_seed);
        }));
    }

    models::IsolationForest proto;
    for (auto name : feature_names) {
        proto.add_feature_names(std::string(name));
    }
    for (auto& task : tasks) {
        *proto.add_trees() = task.Get();
    }
    proto.set_max_samples(static_cast<int64_t>(sample_size));
    proto.set_contamination(params.contamination);

    const auto unthresholded = IsolationForestModel::FromProto(proto);
    const auto scores = unthresholded.ScoreBatch(rows, num_features);
    proto.set_score_threshold(Quantile(scores, 1.0 - params.contamination));

    LOG_INFO() << "Isolation forest: " << params.n_estimators << " trees on " << total
               << " rows, max_samples=" << sample_size
               << ", score threshold=" << proto.score_threshold();
    return IsolationForestModel::FromProto(proto);
}

} // namespace fraud_fusion::training
