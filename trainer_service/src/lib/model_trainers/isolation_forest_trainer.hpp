#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <models/artifacts.pb.h>

#include "ml_model/isolation_forest_model.hpp"

namespace fraud_fusion::training {

struct IsolationForestParams {
    int n_estimators = 100;
    int max_samples = 256;
    double contamination = 0.01;
    uint64_t seed = 42;
};

// Grows one isolation tree on a subsample of `rows` drawn without replacement.
// Children are appended after their parent.
models::IsolationTree BuildIsolationTree(const std::vector<float>& rows,
                                         std::size_t num_features,
                                         std::size_t sample_size,
                                         uint64_t seed);

// Value below which `quantile` of `values` lie, linear interpolation.
double Quantile(std::vector<double> values, double quantile);

// Trees are grown concurrently, one task per tree, each with seed + index.
// Must run inside the userver engine. The outlier threshold is the
// (1 - contamination) quantile of the training scores.
IsolationForestModel FitIsolationForest(const std::vector<float>& rows,
                                        std::size_t num_features,
                                        const std::vector<std::string_view>& feature_names,
                                        const IsolationForestParams& params);

} // namespace fraud_fusion::training
