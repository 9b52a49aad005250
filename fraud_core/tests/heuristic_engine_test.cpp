#include <userver/utest/utest.hpp>

#include "decision_engine/decision_engine.hpp"
#include "feature_engineer/payment_features.hpp"
#include "heuristic_engine/heuristic_engine.hpp"

namespace fraud_fusion {

namespace {

transaction::PaymentTransaction MakePayment(const std::string& type, double amount,
                                            double old_org, double new_orig,
                                            double old_dest = 0.0, double new_dest = 0.0) {
    transaction::PaymentTransaction txn;
    txn.set_step(1);
    txn.set_type(type);
    txn.set_amount(amount);
    txn.set_oldbalance_org(old_org);
    txn.set_newbalance_orig(new_orig);
    txn.set_oldbalance_dest(old_dest);
    txn.set_newbalance_dest(new_dest);
    return txn;
}

HeuristicVerdict Evaluate(const transaction::PaymentTransaction& txn) {
    return EvaluatePaymentHeuristics(txn, ErrorBalanceOrg(txn));
}

} // anonymous namespace

TEST(HeuristicEngine, RuleTableVersion) {
    EXPECT_EQ(kPaymentRuleTable.version, 2);
    EXPECT_DOUBLE_EQ(kPaymentRuleTable.balance_error_epsilon, 0.01);
}

TEST(HeuristicEngine, FullDrainIsHighRisk) {
    const auto txn = MakePayment("TRANSFER", 50000.0, 50000.0, 0.0, 0.0, 50000.0);
    ASSERT_DOUBLE_EQ(ErrorBalanceOrg(txn), 0.0);

    const auto verdict = Evaluate(txn);
    EXPECT_DOUBLE_EQ(verdict.probability, 0.95);
    ASSERT_EQ(verdict.factors.size(), 2u);
    EXPECT_EQ(verdict.factors[0].description(), "Balance Drain: Full account emptied (50,000.00 → 0)");
    EXPECT_EQ(verdict.factors[0].severity(), scoring::RiskFactor::DANGER);
    EXPECT_EQ(verdict.factors[1].description(),
              "High Amount-to-Balance Ratio: 100.0% of available balance");

    const auto result = Decide(0.0, verdict.probability, verdict.factors, "XGBoost");
    EXPECT_TRUE(result.is_fraud());
    EXPECT_EQ(result.risk_level(), scoring::PredictionResult::HIGH);
    EXPECT_GE(result.probability(), 0.95);
    EXPECT_EQ(result.explanation(),
              "Risk Factors: Balance Drain: Full account emptied (50,000.00 → 0); "
              "High Amount-to-Balance Ratio: 100.0% of available balance.");
}

TEST(HeuristicEngine, ConsistentPaymentFiresNothing) {
    const auto txn = MakePayment("PAYMENT", 5000.0, 150000.0, 145000.0, 0.0, 5000.0);
    const auto verdict = Evaluate(txn);
    EXPECT_DOUBLE_EQ(verdict.probability, 0.0);
    EXPECT_TRUE(verdict.factors.empty());

    const auto result = Decide(0.02, verdict.probability, verdict.factors, "XGBoost");
    EXPECT_FALSE(result.is_fraud());
    EXPECT_EQ(result.risk_level(), scoring::PredictionResult::LOW);
    EXPECT_EQ(result.explanation(), "Transaction parameters are consistent with legitimate behavior.");
    ASSERT_EQ(result.factors_size(), 1);
    EXPECT_EQ(result.factors(0).description(), "All checks passed: no anomalies detected");
    EXPECT_EQ(result.factors(0).severity(), scoring::RiskFactor::INFO);
}

TEST(HeuristicEngine, NegativeBalanceAlwaysDominates) {
    for (double amount : {0.0, 100.0, 250000.0}) {
        for (double old_org : {0.0, 100.0, 1e6}) {
            const auto txn = MakePayment("CASH_OUT", amount, old_org, -100.0);
            const auto verdict = Evaluate(txn);
            EXPECT_GE(verdict.probability, 0.99);
            ASSERT_FALSE(verdict.factors.empty());
            EXPECT_EQ(verdict.factors[0].description(),
                      "Illegal Overdraft: Sender balance went negative, indicating a forced withdrawal");
            EXPECT_EQ(verdict.factors[0].severity(), scoring::RiskFactor::DANGER);

            const auto result = Decide(0.0, verdict.probability, verdict.factors, "XGBoost");
            EXPECT_GE(result.probability(), 0.99);
            EXPECT_TRUE(result.is_fraud());
        }
    }
}

TEST(HeuristicEngine, BalanceDiscrepancyAndHighAmount) {
    const auto txn = MakePayment("TRANSFER", 1234567.891, 2000000.0, 1000000.0);
    const auto verdict = Evaluate(txn);

    EXPECT_DOUBLE_EQ(verdict.probability, 0.85);
    ASSERT_EQ(verdict.factors.size(), 2u);
    EXPECT_EQ(verdict.factors[0].description(),
              "Balance Discrepancy: Error of 234,567.89 detected (expected ≈ 0)");
    EXPECT_EQ(verdict.factors[0].severity(), scoring::RiskFactor::WARNING);
    EXPECT_EQ(verdict.factors[1].description(),
              "High Amount: 1,234,567.89 exceeds 150,000 threshold");
}

TEST(HeuristicEngine, DiscrepancyBelowEpsilonIsIgnored) {
    const auto txn = MakePayment("TRANSFER", 100.0, 1000.0, 900.005);
    const auto verdict = Evaluate(txn);
    EXPECT_DOUBLE_EQ(verdict.probability, 0.0);
    EXPECT_TRUE(verdict.factors.empty());
}

TEST(HeuristicEngine, TinyNegativeDiscrepancyKeepsItsSign) {
    PaymentRuleTable table = kPaymentRuleTable;
    table.balance_error_epsilon = 0.0001;

    const auto txn = MakePayment("TRANSFER", 100.0, 1000.0, 900.0);
    const auto verdict = EvaluatePaymentHeuristics(txn, -0.003, table);
    ASSERT_EQ(verdict.factors.size(), 1u);
    EXPECT_EQ(verdict.factors[0].description(),
              "Balance Discrepancy: Error of -0.00 detected (expected ≈ 0)");
}

TEST(HeuristicEngine, HighRatioDoesNotRaiseProbability) {
    const auto txn = MakePayment("CASH_OUT", 950.0, 1000.0, 50.0);
    const auto verdict = Evaluate(txn);
    EXPECT_DOUBLE_EQ(verdict.probability, 0.0);
    ASSERT_EQ(verdict.factors.size(), 1u);
    EXPECT_EQ(verdict.factors[0].description(),
              "High Amount-to-Balance Ratio: 95.0% of available balance");
}

TEST(HeuristicEngine, CardDistanceRule) {
    EXPECT_TRUE(EvaluateCardHeuristics(99.9).factors.empty());

    const auto verdict = EvaluateCardHeuristics(150.27);
    EXPECT_DOUBLE_EQ(verdict.probability, 0.0);
    ASSERT_EQ(verdict.factors.size(), 1u);
    EXPECT_EQ(verdict.factors[0].description(), "Distance anomaly: 150.3 km from merchant");
    EXPECT_EQ(verdict.factors[0].severity(), scoring::RiskFactor::WARNING);
}

} // namespace fraud_fusion
