#pragma once

#include <string>
#include <vector>

#include "model_interface/IProbabilityModel.hpp"

// Forward declaration for XGBoost
typedef void* BoosterHandle;

namespace fraud_fusion {

// Champion model: XGBoost binary:logistic booster.
class BoostedTreeModel final : public IProbabilityModel {
public:
    BoostedTreeModel() = default;
    // Takes ownership of a trained booster.
    explicit BoostedTreeModel(BoosterHandle booster);
    ~BoostedTreeModel() override;

    BoostedTreeModel(const BoostedTreeModel&) = delete;
    BoostedTreeModel& operator=(const BoostedTreeModel&) = delete;
    BoostedTreeModel(BoostedTreeModel&& other) noexcept;
    BoostedTreeModel& operator=(BoostedTreeModel&& other) noexcept;

    // JSON model file written by SaveToFile.
    bool LoadFromFile(const std::string& path);

    // Throws std::runtime_error on failure.
    void SaveToFile(const std::string& path) const;

    bool IsLoaded() const { return booster_ != nullptr; }

    std::vector<double> PredictBatch(
        const std::vector<float>& rows, std::size_t num_features) const override;

    std::string_view Name() const override { return "XGBoost"; }

private:
    void Reset();

    BoosterHandle booster_ = nullptr;
};

} // namespace fraud_fusion
