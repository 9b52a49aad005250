#include <algorithm>

#include <userver/utest/utest.hpp>

#include "decision_engine/decision_engine.hpp"
#include "heuristic_engine/heuristic_engine.hpp"

namespace fraud_fusion {

namespace {

std::vector<scoring::RiskFactor> Factors(std::initializer_list<const char*> descriptions) {
    std::vector<scoring::RiskFactor> factors;
    for (const auto* d : descriptions) {
        factors.push_back(MakeRiskFactor(d, scoring::RiskFactor::WARNING));
    }
    return factors;
}

} // anonymous namespace

TEST(DecisionEngine, ProbabilityIsExactlyTheMax) {
    const double grid[] = {0.0, 0.1, 0.4, 0.41, 0.5, 0.7, 0.8, 0.95, 1.0};
    for (double model : grid) {
        for (double heuristic : grid) {
            const auto result = Decide(model, heuristic, {}, "XGBoost");
            EXPECT_EQ(result.probability(), std::max(model, heuristic));
            EXPECT_GE(result.probability(), 0.0);
            EXPECT_LE(result.probability(), 1.0);
        }
    }
}

TEST(DecisionEngine, RiskTiers) {
    EXPECT_EQ(RiskLevelFor(0.81), scoring::PredictionResult::HIGH);
    EXPECT_EQ(RiskLevelFor(0.8), scoring::PredictionResult::MEDIUM);
    EXPECT_EQ(RiskLevelFor(0.41), scoring::PredictionResult::MEDIUM);
    EXPECT_EQ(RiskLevelFor(0.4), scoring::PredictionResult::LOW);
    EXPECT_EQ(RiskLevelFor(0.0), scoring::PredictionResult::LOW);
}

TEST(DecisionEngine, FraudBoundaryIsStrict) {
    EXPECT_FALSE(Decide(0.5, 0.0, {}, "XGBoost").is_fraud());
    EXPECT_TRUE(Decide(0.0, 0.51, Factors({"x"}), "XGBoost").is_fraud());
}

TEST(DecisionEngine, ModelFactorIsPrepended) {
    const auto high = Decide(0.9, 0.0, Factors({"rule"}), "XGBoost");
    ASSERT_EQ(high.factors_size(), 2);
    EXPECT_EQ(high.factors(0).description(),
              "AI Model: XGBoost detected suspicious pattern (confidence: 90.0%)");
    EXPECT_EQ(high.factors(0).severity(), scoring::RiskFactor::DANGER);
    EXPECT_EQ(high.factors(1).description(), "rule");

    const auto medium = Decide(0.625, 0.0, {}, "Random Forest");
    ASSERT_EQ(medium.factors_size(), 1);
    EXPECT_EQ(medium.factors(0).description(),
              "AI Model: Random Forest detected suspicious pattern (confidence: 62.5%)");
    EXPECT_EQ(medium.factors(0).severity(), scoring::RiskFactor::WARNING);
    EXPECT_EQ(medium.risk_level(), scoring::PredictionResult::MEDIUM);
}

TEST(DecisionEngine, ExplanationUsesFirstThreeFactors) {
    const auto result = Decide(0.0, 0.99, Factors({"a", "b", "c", "d"}), "XGBoost");
    EXPECT_EQ(result.explanation(), "Risk Factors: a; b; c.");
    EXPECT_EQ(result.factors_size(), 4);
}

TEST(DecisionEngine, NotFraudKeepsExistingFactors) {
    const auto result = Decide(0.1, 0.0, Factors({"High Amount-to-Balance Ratio"}), "XGBoost");
    EXPECT_FALSE(result.is_fraud());
    EXPECT_EQ(result.explanation(), "Transaction parameters are consistent with legitimate behavior.");
    ASSERT_EQ(result.factors_size(), 1);
    EXPECT_EQ(result.factors(0).description(), "High Amount-to-Balance Ratio");
}

TEST(DecisionEngine, MediumRiskWithoutFactorsGetsDefault) {
    const auto result = Decide(0.45, 0.0, {}, "XGBoost");
    EXPECT_FALSE(result.is_fraud());
    EXPECT_EQ(result.risk_level(), scoring::PredictionResult::MEDIUM);
    ASSERT_EQ(result.factors_size(), 1);
    EXPECT_EQ(result.factors(0).severity(), scoring::RiskFactor::INFO);
}

TEST(DecisionEngine, SameInputSameOutput) {
    const auto first = Decide(0.73, 0.85, Factors({"a", "b"}), "XGBoost");
    const auto second = Decide(0.73, 0.85, Factors({"a", "b"}), "XGBoost");
    EXPECT_EQ(first.SerializeAsString(), second.SerializeAsString());
}

} // namespace fraud_fusion
