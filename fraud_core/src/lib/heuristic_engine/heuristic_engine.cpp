#include "heuristic_engine.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <fmt/format.h>

namespace fraud_fusion {

namespace {

// 1234567.891 -> "1,234,567.89"
std::string FormatMoney(double value, int precision) {
    std::string digits = fmt::format("{:.{}f}", std::abs(value), precision);
    const auto dot = digits.find('.');
    auto int_end = (dot == std::string::npos) ? digits.size() : dot;

    std::string grouped;
    grouped.reserve(digits.size() + int_end / 3 + 1);
    for (std::size_t i = 0; i < int_end; ++i) {
        if (i > 0 && (int_end - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(digits[i]);
    }
    grouped.append(digits, int_end, std::string::npos);
    return std::signbit(value) ? "-" + grouped : grouped;
}

} // anonymous namespace

scoring::RiskFactor MakeRiskFactor(std::string description, scoring::RiskFactor::Severity severity) {
    scoring::RiskFactor factor;
    factor.set_description(std::move(description));
    factor.set_severity(severity);
    return factor;
}

HeuristicVerdict EvaluatePaymentHeuristics(
    const transaction::PaymentTransaction& txn,
    double error_balance_org,
    const PaymentRuleTable& table) {

    HeuristicVerdict verdict;
    auto fire = [&verdict](double probability) {
        verdict.probability = std::max(verdict.probability, probability);
    };

    // R1: the sender balance can never go negative.
    if (txn.newbalance_orig() < 0) {
        fire(table.overdraft_probability);
        verdict.factors.push_back(MakeRiskFactor(
            "Illegal Overdraft: Sender balance went negative, indicating a forced withdrawal",
            scoring::RiskFactor::DANGER));
    }

    // R2
    if (txn.newbalance_orig() == 0 && txn.amount() > 0 && txn.amount() >= txn.oldbalance_org()) {
        fire(table.drain_probability);
        verdict.factors.push_back(MakeRiskFactor(
            fmt::format("Balance Drain: Full account emptied ({} → 0)",
                        FormatMoney(txn.oldbalance_org(), 2)),
            scoring::RiskFactor::DANGER));
    }

    // R3
    if (std::abs(error_balance_org) > table.balance_error_epsilon) {
        fire(table.balance_error_probability);
        verdict.factors.push_back(MakeRiskFactor(
            fmt::format("Balance Discrepancy: Error of {} detected (expected ≈ 0)",
                        FormatMoney(error_balance_org, 2)),
            scoring::RiskFactor::WARNING));
    }

    // R4
    if (txn.amount() > table.high_value_amount) {
        fire(table.high_value_probability);
        verdict.factors.push_back(MakeRiskFactor(
            fmt::format("High Amount: {} exceeds {} threshold",
                        FormatMoney(txn.amount(), 2), FormatMoney(table.high_value_amount, 0)),
            scoring::RiskFactor::WARNING));
    }

    // R5 explains but does not raise the floor.
    if (txn.oldbalance_org() > 0) {
        const double ratio = txn.amount() / txn.oldbalance_org();
        if (ratio > table.high_ratio) {
            verdict.factors.push_back(MakeRiskFactor(
                fmt::format("High Amount-to-Balance Ratio: {:.1f}% of available balance", ratio * 100.0),
                scoring::RiskFactor::WARNING));
        }
    }

    return verdict;
}

HeuristicVerdict EvaluateCardHeuristics(double distance_km) {
    HeuristicVerdict verdict;
    if (distance_km > kDistanceAnomalyKm) {
        verdict.factors.push_back(MakeRiskFactor(
            fmt::format("Distance anomaly: {:.1f} km from merchant", distance_km),
            scoring::RiskFactor::WARNING));
    }
    return verdict;
}

} // namespace fraud_fusion
