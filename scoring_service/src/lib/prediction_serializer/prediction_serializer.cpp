#include "prediction_serializer.hpp"

#include <userver/formats/json/value_builder.hpp>

namespace fraud_fusion {

std::string_view SeverityName(scoring::RiskFactor::Severity severity) {
    switch (severity) {
        case scoring::RiskFactor::DANGER:
            return "danger";
        case scoring::RiskFactor::WARNING:
            return "warning";
        default:
            return "info";
    }
}

std::string_view RiskLevelName(scoring::PredictionResult::RiskLevel level) {
    switch (level) {
        case scoring::PredictionResult::HIGH:
            return "High";
        case scoring::PredictionResult::MEDIUM:
            return "Medium";
        default:
            return "Low";
    }
}

userver::formats::json::Value SerializePrediction(const scoring::PredictionResult& result) {
    userver::formats::json::ValueBuilder builder;
    builder["probability"] = result.probability();
    builder["is_fraud"] = result.is_fraud();
    builder["risk_level"] = std::string(RiskLevelName(result.risk_level()));
    builder["explanation"] = result.explanation();

    userver::formats::json::ValueBuilder factors(userver::formats::common::Type::kArray);
    for (const auto& factor : result.factors()) {
        userver::formats::json::ValueBuilder item;
        item["description"] = factor.description();
        item["severity"] = std::string(SeverityName(factor.severity()));
        factors.PushBack(std::move(item));
    }
    builder["factors"] = std::move(factors);
    return builder.ExtractValue();
}

userver::formats::json::Value SerializeHealth(const std::vector<std::string>& loaded_keys) {
    userver::formats::json::ValueBuilder builder;
    builder["status"] = "ok";
    userver::formats::json::ValueBuilder keys(userver::formats::common::Type::kArray);
    for (const auto& key : loaded_keys) {
        keys.PushBack(key);
    }
    builder["models_loaded"] = std::move(keys);
    return builder.ExtractValue();
}

userver::formats::json::Value SerializeError(std::string_view detail) {
    userver::formats::json::ValueBuilder builder;
    builder["detail"] = std::string(detail);
    return builder.ExtractValue();
}

} // namespace fraud_fusion
