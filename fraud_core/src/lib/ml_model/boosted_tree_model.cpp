#include "boosted_tree_model.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

#include <xgboost/c_api.h>

#include <userver/logging/log.hpp>

namespace fraud_fusion {

BoostedTreeModel::BoostedTreeModel(BoosterHandle booster)
    : booster_(booster) {}

BoostedTreeModel::~BoostedTreeModel() {
    Reset();
}

BoostedTreeModel::BoostedTreeModel(BoostedTreeModel&& other) noexcept
    : booster_(std::exchange(other.booster_, nullptr)) {}

BoostedTreeModel& BoostedTreeModel::operator=(BoostedTreeModel&& other) noexcept {
    if (this != &other) {
        Reset();
        booster_ = std::exchange(other.booster_, nullptr);
    }
    return *this;
}

void BoostedTreeModel::Reset() {
    if (booster_) {
        XGBoosterFree(booster_);
        booster_ = nullptr;
    }
}

bool BoostedTreeModel::LoadFromFile(const std::string& path) {
    Reset();

    std::ifstream check(path);
    if (!check.good()) {
        LOG_ERROR() << "XGBoost model file not found: " << path;
        return false;
    }
    check.close();

    if (XGBoosterCreate(nullptr, 0, &booster_) != 0) {
        LOG_ERROR() << "XGBoosterCreate failed: " << XGBGetLastError();
        booster_ = nullptr;
        return false;
    }
    if (XGBoosterLoadModel(booster_, path.c_str()) != 0) {
        LOG_ERROR() << "XGBoosterLoadModel failed for " << path << ": " << XGBGetLastError();
        Reset();
        return false;
    }
    // Requests are already parallel, one thread per prediction is enough.
    if (XGBoosterSetParam(booster_, "nthread", "1") != 0) {
        LOG_WARNING() << "Failed to set nthread for " << path << ": " << XGBGetLastError();
    }

    LOG_INFO() << "Loaded XGBoost model from " << path;
    return true;
}

void BoostedTreeModel::SaveToFile(const std::string& path) const {
    if (!booster_) {
        throw std::runtime_error("XGBoost model not loaded");
    }
    if (XGBoosterSaveModel(booster_, path.c_str()) != 0) {
        throw std::runtime_error(std::string("XGBoosterSaveModel failed: ") + XGBGetLastError());
    }
}

std::vector<double> BoostedTreeModel::PredictBatch(
    const std::vector<float>& rows, std::size_t num_features) const {

    if (!booster_) {
        throw std::runtime_error("XGBoost model not loaded");
    }
    if (num_features == 0 || rows.size() % num_features != 0) {
        throw std::invalid_argument("Feature matrix size is not a multiple of the column count");
    }
    const bst_ulong num_rows = static_cast<bst_ulong>(rows.size() / num_features);

    DMatrixHandle dmat;
    if (XGDMatrixCreateFromMat(rows.data(), num_rows,
                               static_cast<bst_ulong>(num_features),
                               std::numeric_limits<float>::quiet_NaN(), &dmat) != 0) {
        throw std::runtime_error(std::string("XGDMatrixCreateFromMat failed: ") + XGBGetLastError());
    }

    bst_ulong out_len = 0;
    const float* out_result = nullptr;
    if (XGBoosterPredict(booster_, dmat, 0, 0, 0, &out_len, &out_result) != 0) {
        XGDMatrixFree(dmat);
        throw std::runtime_error(std::string("XGBoosterPredict failed: ") + XGBGetLastError());
    }

    std::vector<double> probabilities(out_result, out_result + out_len);
    XGDMatrixFree(dmat);

    if (probabilities.size() != num_rows) {
        throw std::runtime_error("XGBoost returned unexpected number of predictions");
    }
    return probabilities;
}

} // namespace fraud_fusion
