#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <userver/formats/json/value.hpp>

#include <scoring/prediction.pb.h>

namespace fraud_fusion {

// "info", "warning", "danger"
std::string_view SeverityName(scoring::RiskFactor::Severity severity);

// "Low", "Medium", "High"
std::string_view RiskLevelName(scoring::PredictionResult::RiskLevel level);

// {probability, is_fraud, risk_level, explanation, factors: [{description, severity}]}
userver::formats::json::Value SerializePrediction(const scoring::PredictionResult& result);

userver::formats::json::Value SerializeHealth(const std::vector<std::string>& loaded_keys);

userver::formats::json::Value SerializeError(std::string_view detail);

} // namespace fraud_fusion
