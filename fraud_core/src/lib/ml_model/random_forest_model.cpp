#include "random_forest_model.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <LightGBM/c_api.h>

#include <userver/logging/log.hpp>

namespace fraud_fusion {

RandomForestModel::RandomForestModel(BoosterHandle booster)
    : booster_(booster) {}

RandomForestModel::~RandomForestModel() {
    Reset();
}

RandomForestModel::RandomForestModel(RandomForestModel&& other) noexcept
    : booster_(std::exchange(other.booster_, nullptr)) {}

RandomForestModel& RandomForestModel::operator=(RandomForestModel&& other) noexcept {
    if (this != &other) {
        Reset();
        booster_ = std::exchange(other.booster_, nullptr);
    }
    return *this;
}

void RandomForestModel::Reset() {
    if (booster_) {
        LGBM_BoosterFree(booster_);
        booster_ = nullptr;
    }
}

bool RandomForestModel::LoadFromFile(const std::string& path) {
    Reset();

    std::ifstream check(path);
    if (!check.good()) {
        LOG_ERROR() << "LightGBM model file not found: " << path;
        return false;
    }
    check.close();

    int num_iter = 0;
    if (LGBM_BoosterCreateFromModelfile(path.c_str(), &num_iter, &booster_) != 0) {
        LOG_ERROR() << "Failed to load LightGBM model from " << path << ": " << LGBM_GetLastError();
        booster_ = nullptr;
        return false;
    }
    LOG_INFO() << "Loaded LightGBM model from " << path << " (" << num_iter << " trees)";
    return true;
}

void RandomForestModel::SaveToFile(const std::string& path) const {
    if (!booster_) {
        throw std::runtime_error("LightGBM model not loaded");
    }
    if (LGBM_BoosterSaveModel(booster_, 0, -1, C_API_FEATURE_IMPORTANCE_SPLIT, path.c_str()) != 0) {
        throw std::runtime_error(std::string("LGBM_BoosterSaveModel failed: ") + LGBM_GetLastError());
    }
}

std::vector<double> RandomForestModel::PredictBatch(
    const std::vector<float>& rows, std::size_t num_features) const {

    if (!booster_) {
        throw std::runtime_error("LightGBM model not loaded");
    }
    if (num_features == 0 || rows.size() % num_features != 0) {
        throw std::invalid_argument("Feature matrix size is not a multiple of the column count");
    }
    const int num_rows = static_cast<int>(rows.size() / num_features);

    std::vector<double> probabilities(static_cast<std::size_t>(num_rows), 0.0);
    int64_t out_len = 0;
    if (LGBM_BoosterPredictForMat(booster_, rows.data(), C_API_DTYPE_FLOAT32,
                                  num_rows, static_cast<int>(num_features), 1,
                                  C_API_PREDICT_NORMAL, 0, -1, "num_threads=1",
                                  &out_len, probabilities.data()) != 0) {
        throw std::runtime_error(std::string("LGBM_BoosterPredictForMat failed: ") + LGBM_GetLastError());
    }
    if (out_len != num_rows) {
        throw std::runtime_error("LightGBM returned unexpected number of predictions");
    }
    return probabilities;
}

} // namespace fraud_fusion
