#include "boosted_tree_trainer.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <xgboost/c_api.h>

namespace fraud_fusion::training {

namespace {

void Check(int status, const char* call) {
    if (status != 0) {
        throw std::runtime_error(fmt::format("{} failed: {}", call, XGBGetLastError()));
    }
}

class DMatrixGuard {
public:
    DMatrixGuard() = default;
    ~DMatrixGuard() {
        if (handle_) XGDMatrixFree(handle_);
    }
    DMatrixGuard(const DMatrixGuard&) = delete;
    DMatrixGuard& operator=(const DMatrixGuard&) = delete;

    DMatrixHandle* Out() { return &handle_; }
    DMatrixHandle Get() const { return handle_; }

private:
    DMatrixHandle handle_ = nullptr;
};

} // anonymous namespace

std::string Describe(const BoostedTreeParams& p) {
    return fmt::format("max_depth={} learning_rate={} n_estimators={} scale_pos_weight={:.2f}",
                       p.max_depth, p.learning_rate, p.n_estimators, p.scale_pos_weight);
}

BoostedTreeModel TrainBoostedTree(const LabeledMatrix& data, const BoostedTreeParams& params) {
    if (data.Empty()) {
        throw std::invalid_argument("Cannot train XGBoost on an empty matrix");
    }

    DMatrixGuard dtrain;
    Check(XGDMatrixCreateFromMat(data.Values().data(),
                                 static_cast<bst_ulong>(data.Rows()),
                                 static_cast<bst_ulong>(data.NumFeatures()),
                                 std::numeric_limits<float>::quiet_NaN(), dtrain.Out()),
          "XGDMatrixCreateFromMat");

    std::vector<float> labels(data.Labels().begin(), data.Labels().end());
    Check(XGDMatrixSetFloatInfo(dtrain.Get(), "label", labels.data(),
                                static_cast<bst_ulong>(labels.size())),
          "XGDMatrixSetFloatInfo");

    DMatrixHandle cache[] = {dtrain.Get()};
    BoosterHandle booster = nullptr;
    Check(XGBoosterCreate(cache, 1, &booster), "XGBoosterCreate");
    BoostedTreeModel model(booster);

    const std::pair<const char*, std::string> settings[] = {
        {"objective", "binary:logistic"},
        {"eval_metric", "aucpr"},
        {"tree_method", "hist"},
        {"verbosity", "0"},
        {"seed", std::to_string(params.seed)},
        {"nthread", std::to_string(params.nthread)},
        {"max_depth", std::to_string(params.max_depth)},
        {"eta", fmt::format("{}", params.learning_rate)},
        {"scale_pos_weight", fmt::format("{}", params.scale_pos_weight)},
    };
    for (const auto& [name, value] : settings) {
        Check(XGBoosterSetParam(booster, name, value.c_str()), "XGBoosterSetParam");
    }

    for (int iter = 0; iter < params.n_estimators; ++iter) {
        Check(XGBoosterUpdateOneIter(booster, iter, dtrain.Get()), "XGBoosterUpdateOneIter");
    }
    return model;
}

} // namespace fraud_fusion::training
