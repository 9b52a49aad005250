#pragma once

#include <string>
#include <vector>

#include <scoring/prediction.pb.h>
#include <transaction/transaction.pb.h>

namespace fraud_fusion {

// Thresholds of the payment rule table. Bump `version` whenever a value
// changes so verdicts stay traceable to the table that produced them.
struct PaymentRuleTable {
    int version;
    double overdraft_probability;
    double drain_probability;
    double balance_error_epsilon;
    double balance_error_probability;
    double high_value_amount;
    double high_value_probability;
    double high_ratio;
};

inline constexpr PaymentRuleTable kPaymentRuleTable = {
    /*version=*/2,
    /*overdraft_probability=*/0.99,
    /*drain_probability=*/0.95,
    /*balance_error_epsilon=*/0.01,
    /*balance_error_probability=*/0.85,
    /*high_value_amount=*/150000.0,
    /*high_value_probability=*/0.70,
    /*high_ratio=*/0.9,
};

inline constexpr double kDistanceAnomalyKm = 100.0;

struct HeuristicVerdict {
    // Highest floor among fired rules, 0 when none fired.
    double probability = 0.0;
    std::vector<scoring::RiskFactor> factors;
};

// Every rule is evaluated; factors keep rule order.
HeuristicVerdict EvaluatePaymentHeuristics(
    const transaction::PaymentTransaction& txn,
    double error_balance_org,
    const PaymentRuleTable& table = kPaymentRuleTable);

// Distance rule of the card domain. Adds a factor only.
HeuristicVerdict EvaluateCardHeuristics(double distance_km);

scoring::RiskFactor MakeRiskFactor(std::string description, scoring::RiskFactor::Severity severity);

} // namespace fraud_fusion
