#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <scoring/prediction.pb.h>

namespace fraud_fusion {

inline constexpr double kFraudThreshold = 0.5;
inline constexpr double kHighRiskThreshold = 0.8;
inline constexpr double kMediumRiskThreshold = 0.4;
inline constexpr std::size_t kMaxExplainedFactors = 3;

scoring::PredictionResult::RiskLevel RiskLevelFor(double probability);

// Fuses a model probability with the heuristic floor. The result is
// probability = max(model, heuristic); factors are returned in the order
// given, preceded by the model factor when the model alone flags fraud.
scoring::PredictionResult Decide(
    double model_probability,
    double heuristic_probability,
    std::vector<scoring::RiskFactor> factors,
    std::string_view model_label);

} // namespace fraud_fusion
