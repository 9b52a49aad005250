#pragma once

#include <string>
#include <vector>

#include "model_interface/IProbabilityModel.hpp"

// Forward declaration for LightGBM
typedef void* BoosterHandle;

namespace fraud_fusion {

// Card-domain model: LightGBM booster trained with boosting=rf.
class RandomForestModel final : public IProbabilityModel {
public:
    RandomForestModel() = default;
    // Takes ownership of a trained booster.
    explicit RandomForestModel(BoosterHandle booster);
    ~RandomForestModel() override;

    RandomForestModel(const RandomForestModel&) = delete;
    RandomForestModel& operator=(const RandomForestModel&) = delete;
    RandomForestModel(RandomForestModel&& other) noexcept;
    RandomForestModel& operator=(RandomForestModel&& other) noexcept;

    bool LoadFromFile(const std::string& path);
    void SaveToFile(const std::string& path) const;

    bool IsLoaded() const { return booster_ != nullptr; }

    std::vector<double> PredictBatch(
        const std::vector<float>& rows, std::size_t num_features) const override;

    std::string_view Name() const override { return "Random Forest"; }

private:
    void Reset();

    BoosterHandle booster_ = nullptr;
};

} // namespace fraud_fusion
