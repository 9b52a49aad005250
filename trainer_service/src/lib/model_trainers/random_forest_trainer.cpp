#include "random_forest_trainer.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <LightGBM/c_api.h>

namespace fraud_fusion::training {

namespace {

void Check(int status, const char* call) {
    if (status != 0) {
        throw std::runtime_error(fmt::format("{} failed: {}", call, LGBM_GetLastError()));
    }
}

class DatasetGuard {
public:
    DatasetGuard() = default;
    ~DatasetGuard() {
        if (handle_) LGBM_DatasetFree(handle_);
    }
    DatasetGuard(const DatasetGuard&) = delete;
    DatasetGuard& operator=(const DatasetGuard&) = delete;

    DatasetHandle* Out() { return &handle_; }
    DatasetHandle Get() const { return handle_; }

private:
    DatasetHandle handle_ = nullptr;
};

} // anonymous namespace

std::string Describe(const RandomForestParams& p) {
    return fmt::format("n_estimators={} max_depth={}", p.n_estimators, p.max_depth);
}

std::string ToLightGbmParams(const RandomForestParams& params) {
    const int num_leaves = std::min(1 << std::min(params.max_depth, 17), 131072);
    std::ostringstream oss;
    oss << "objective=binary"
        << " boosting=rf"
        << " bagging_freq=1"
        << " bagging_fraction=0.632"
        << " feature_fraction=0.8"
        << " is_unbalance=true"
        << " min_data_in_leaf=1"
        << " max_depth=" << params.max_depth
        << " num_leaves=" << std::max(num_leaves, 2)
        << " seed=" << params.seed
        << " num_threads=" << params.num_threads
        << " verbosity=-1";
    return oss.str();
}

RandomForestModel TrainRandomForest(const LabeledMatrix& data, const RandomForestParams& params) {
    if (data.Empty()) {
        throw std::invalid_argument("Cannot train LightGBM on an empty matrix");
    }
    const std::string param_str = ToLightGbmParams(params);

    DatasetGuard dataset;
    Check(LGBM_DatasetCreateFromMat(data.Values().data(),
                                    C_API_DTYPE_FLOAT32,
                                    static_cast<int32_t>(data.Rows()),
                                    static_cast<int32_t>(data.NumFeatures()),
                                    1,  // row major
                                    param_str.c_str(),
                                    nullptr,
                                    dataset.Out()),
          "LGBM_DatasetCreateFromMat");

    std::vector<float> labels(data.Labels().begin(), data.Labels().end());
    Check(LGBM_DatasetSetField(dataset.Get(), "label", labels.data(),
                               static_cast<int>(labels.size()), C_API_DTYPE_FLOAT32),
          "LGBM_DatasetSetField");

    BoosterHandle booster = nullptr;
    Check(LGBM_BoosterCreate(dataset.Get(), param_str.c_str(), &booster), "LGBM_BoosterCreate");
    RandomForestModel trained(booster);

    for (int iter = 0; iter < params.n_estimators; ++iter) {
        int is_finished = 0;
        Check(LGBM_BoosterUpdateOneIter(booster, &is_finished), "LGBM_BoosterUpdateOneIter");
        if (is_finished) break;
    }

    // The training booster points into `dataset`; hand out a copy rebuilt
    // from the model text so the result outlives it.
    int64_t length = 0;
    Check(LGBM_BoosterSaveModelToString(booster, 0, -1, C_API_FEATURE_IMPORTANCE_SPLIT,
                                        0, &length, nullptr),
          "LGBM_BoosterSaveModelToString");
    std::vector<char> text(static_cast<std::size_t>(length));
    Check(LGBM_BoosterSaveModelToString(booster, 0, -1, C_API_FEATURE_IMPORTANCE_SPLIT,
                                        length, &length, text.data()),
          "LGBM_BoosterSaveModelToString");

    int num_iterations = 0;
    BoosterHandle standalone = nullptr;
    Check(LGBM_BoosterLoadModelFromString(text.data(), &num_iterations, &standalone),
          "LGBM_BoosterLoadModelFromString");
    return RandomForestModel(standalone);
}

} // namespace fraud_fusion::training
