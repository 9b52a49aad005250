#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <models/artifacts.pb.h>

namespace fraud_fusion {

// Expected path length of an unsuccessful BST search over n points, c(n).
double AveragePathLength(int64_t n);

// Unsupervised anomaly detector. Scores lie in (0, 1]; higher is more
// anomalous. Trained only on legitimate rows.
class IsolationForestModel {
public:
    static IsolationForestModel FromProto(const models::IsolationForest& proto);

    const models::IsolationForest& Proto() const { return proto_; }

    const std::vector<std::string>& FeatureNames() const { return feature_names_; }

    double Score(const float* row) const;

    std::vector<double> ScoreBatch(const std::vector<float>& rows, std::size_t num_features) const;

    bool IsOutlier(const float* row) const { return Score(row) > proto_.score_threshold(); }

private:
    explicit IsolationForestModel(models::IsolationForest proto);

    double PathLength(const models::IsolationTree& tree, const float* row) const;

    models::IsolationForest proto_;
    std::vector<std::string> feature_names_;
    double normalizer_ = 1.0;
};

} // namespace fraud_fusion
