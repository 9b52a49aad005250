#include "isolation_forest_model.hpp"

#include <cmath>
#include <stdexcept>

namespace fraud_fusion {

namespace {

constexpr int kLeafFeature = -1;

constexpr double kEulerGamma = 0.5772156649015329;

} // anonymous namespace

double AveragePathLength(int64_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    const double nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + kEulerGamma) - 2.0 * (nd - 1.0) / nd;
}

IsolationForestModel::IsolationForestModel(models::IsolationForest proto)
    : proto_(std::move(proto))
    , feature_names_(proto_.feature_names().begin(), proto_.feature_names().end())
    , normalizer_(AveragePathLength(proto_.max_samples())) {}

IsolationForestModel IsolationForestModel::FromProto(const models::IsolationForest& proto) {
    if (proto.trees_size() == 0 || proto.feature_names_size() == 0 || proto.max_samples() < 2) {
        throw std::invalid_argument("IsolationForest artifact is empty");
    }
    const int num_features = proto.feature_names_size();
    for (const auto& tree : proto.trees()) {
        const int num_nodes = tree.nodes_size();
        if (num_nodes == 0) {
            throw std::invalid_argument("IsolationForest artifact contains an empty tree");
        }
        // Children are stored after their parent, which also rules out cycles.
        for (int i = 0; i < num_nodes; ++i) {
            const auto& node = tree.nodes(i);
            if (node.feature() == kLeafFeature) continue;
            if (node.feature() < 0 || node.feature() >= num_features ||
                node.left() <= i || node.left() >= num_nodes ||
                node.right() <= i || node.right() >= num_nodes) {
                throw std::invalid_argument("IsolationForest artifact has a dangling node");
            }
        }
    }
    return IsolationForestModel(proto);
}

double IsolationForestModel::PathLength(const models::IsolationTree& tree, const float* row) const {
    int id = 0;
    int depth = 0;
    while (tree.nodes(id).feature() != kLeafFeature) {
        const auto& node = tree.nodes(id);
        id = (row[node.feature()] < node.threshold()) ? node.left() : node.right();
        ++depth;
    }
    return static_cast<double>(depth) + AveragePathLength(tree.nodes(id).size());
}

double IsolationForestModel::Score(const float* row) const {
    double total = 0.0;
    for (const auto& tree : proto_.trees()) {
        total += PathLength(tree, row);
    }
    const double mean_path = total / static_cast<double>(proto_.trees_size());
    return std::pow(2.0, -mean_path / normalizer_);
}

std::vector<double> IsolationForestModel::ScoreBatch(
    const std::vector<float>& rows, std::size_t num_features) const {

    if (num_features != feature_names_.size() || rows.size() % num_features != 0) {
        throw std::invalid_argument("Feature matrix does not match the isolation forest layout");
    }
    const std::size_t num_rows = rows.size() / num_features;
    std::vector<double> scores(num_rows);
    for (std::size_t r = 0; r < num_rows; ++r) {
        scores[r] = Score(rows.data() + r * num_features);
    }
    return scores;
}

} // namespace fraud_fusion
