#pragma once

#include <cstdint>
#include <string>

#include "dataset/labeled_matrix.hpp"
#include "ml_model/random_forest_model.hpp"

namespace fraud_fusion::training {

struct RandomForestParams {
    int n_estimators = 100;
    int max_depth = 10;
    uint64_t seed = 42;
    int num_threads = 1;
};

std::string Describe(const RandomForestParams& params);

// LightGBM parameter string for a class-balanced bagged forest.
std::string ToLightGbmParams(const RandomForestParams& params);

// Throws std::runtime_error with the LightGBM error text on failure.
RandomForestModel TrainRandomForest(const LabeledMatrix& data, const RandomForestParams& params);

} // namespace fraud_fusion::training
