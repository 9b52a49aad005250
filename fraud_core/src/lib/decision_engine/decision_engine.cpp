#include "decision_engine.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "heuristic_engine/heuristic_engine.hpp"

namespace fraud_fusion {

scoring::PredictionResult::RiskLevel RiskLevelFor(double probability) {
    if (probability > kHighRiskThreshold) {
        return scoring::PredictionResult::HIGH;
    }
    if (probability > kMediumRiskThreshold) {
        return scoring::PredictionResult::MEDIUM;
    }
    return scoring::PredictionResult::LOW;
}

scoring::PredictionResult Decide(
    double model_probability,
    double heuristic_probability,
    std::vector<scoring::RiskFactor> factors,
    std::string_view model_label) {

    scoring::PredictionResult result;
    const double probability = std::max(model_probability, heuristic_probability);
    const bool is_fraud = probability > kFraudThreshold;

    result.set_probability(probability);
    result.set_is_fraud(is_fraud);
    result.set_risk_level(RiskLevelFor(probability));

    if (model_probability > kFraudThreshold) {
        auto severity = model_probability > kHighRiskThreshold
            ? scoring::RiskFactor::DANGER
            : scoring::RiskFactor::WARNING;
        factors.insert(factors.begin(), MakeRiskFactor(
            fmt::format("AI Model: {} detected suspicious pattern (confidence: {:.1f}%)",
                        model_label, model_probability * 100.0),
            severity));
    }

    if (is_fraud) {
        std::string explanation = "Risk Factors: ";
        const auto shown = std::min(factors.size(), kMaxExplainedFactors);
        for (std::size_t i = 0; i < shown; ++i) {
            if (i > 0) explanation += "; ";
            explanation += factors[i].description();
        }
        explanation += ".";
        result.set_explanation(std::move(explanation));
    } else {
        result.set_explanation("Transaction parameters are consistent with legitimate behavior.");
        if (factors.empty()) {
            factors.push_back(MakeRiskFactor(
                "All checks passed: no anomalies detected", scoring::RiskFactor::INFO));
        }
    }

    for (auto& factor : factors) {
        *result.add_factors() = std::move(factor);
    }
    return result;
}

} // namespace fraud_fusion
