#pragma once

#include <cstdint>
#include <string>

#include "dataset/labeled_matrix.hpp"
#include "ml_model/boosted_tree_model.hpp"

namespace fraud_fusion::training {

struct BoostedTreeParams {
    int max_depth = 6;
    double learning_rate = 0.3;
    int n_estimators = 100;
    double scale_pos_weight = 1.0;
    uint64_t seed = 42;
    int nthread = 1;
};

std::string Describe(const BoostedTreeParams& params);

// binary:logistic booster, one boosting round per estimator.
// Throws std::runtime_error with the XGBoost error text on failure.
BoostedTreeModel TrainBoostedTree(const LabeledMatrix& data, const BoostedTreeParams& params);

} // namespace fraud_fusion::training
