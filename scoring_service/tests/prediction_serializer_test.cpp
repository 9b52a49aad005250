#include <userver/formats/json/serialize.hpp>
#include <userver/utest/utest.hpp>

#include "decision_engine/decision_engine.hpp"
#include "heuristic_engine/heuristic_engine.hpp"
#include "prediction_serializer/prediction_serializer.hpp"

namespace fraud_fusion {

TEST(PredictionSerializer, Names) {
    EXPECT_EQ(SeverityName(scoring::RiskFactor::INFO), "info");
    EXPECT_EQ(SeverityName(scoring::RiskFactor::WARNING), "warning");
    EXPECT_EQ(SeverityName(scoring::RiskFactor::DANGER), "danger");
    EXPECT_EQ(RiskLevelName(scoring::PredictionResult::LOW), "Low");
    EXPECT_EQ(RiskLevelName(scoring::PredictionResult::MEDIUM), "Medium");
    EXPECT_EQ(RiskLevelName(scoring::PredictionResult::HIGH), "High");
}

TEST(PredictionSerializer, FraudResult) {
    const auto result = Decide(0.9, 0.95,
                               {MakeRiskFactor("Balance Drain: Full account emptied (50,000.00 → 0)",
                                               scoring::RiskFactor::DANGER)},
                               "XGBoost");
    const auto json = SerializePrediction(result);

    EXPECT_DOUBLE_EQ(json["probability"].As<double>(), 0.95);
    EXPECT_TRUE(json["is_fraud"].As<bool>());
    EXPECT_EQ(json["risk_level"].As<std::string>(), "High");
    EXPECT_EQ(json["explanation"].As<std::string>(), result.explanation());

    const auto factors = json["factors"];
    ASSERT_TRUE(factors.IsArray());
    ASSERT_EQ(factors.GetSize(), 2u);
    EXPECT_EQ(factors[0]["description"].As<std::string>(),
              "AI Model: XGBoost detected suspicious pattern (confidence: 90.0%)");
    EXPECT_EQ(factors[0]["severity"].As<std::string>(), "danger");
    EXPECT_EQ(factors[1]["severity"].As<std::string>(), "danger");
}

TEST(PredictionSerializer, LegitimateResultKeepsFactorArray) {
    const auto json = SerializePrediction(Decide(0.1, 0.0, {}, "XGBoost"));
    EXPECT_FALSE(json["is_fraud"].As<bool>());
    EXPECT_EQ(json["risk_level"].As<std::string>(), "Low");
    ASSERT_EQ(json["factors"].GetSize(), 1u);
    EXPECT_EQ(json["factors"][0]["severity"].As<std::string>(), "info");
}

TEST(PredictionSerializer, HealthAndError) {
    const auto health = SerializeHealth({"primary", "encoder"});
    EXPECT_EQ(health["status"].As<std::string>(), "ok");
    EXPECT_EQ(health["models_loaded"].As<std::vector<std::string>>(),
              (std::vector<std::string>{"primary", "encoder"}));

    const auto empty = SerializeHealth({});
    EXPECT_TRUE(empty["models_loaded"].IsArray());
    EXPECT_EQ(empty["models_loaded"].GetSize(), 0u);

    EXPECT_EQ(userver::formats::json::ToString(SerializeError("bad input")), R"({"detail":"bad input"})");
}

} // namespace fraud_fusion
