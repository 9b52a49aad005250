#include "scoring_service.hpp"

#include <userver/logging/log.hpp>

#include "decision_engine/decision_engine.hpp"
#include "feature_engineer/card_features.hpp"
#include "feature_engineer/payment_features.hpp"
#include "heuristic_engine/heuristic_engine.hpp"

namespace fraud_fusion {

ScoringService::ScoringService(const ModelRegistry& registry)
    : registry_(registry) {}

scoring::PredictionResult ScoringService::ScorePrimary(
    const transaction::PaymentTransaction& txn) const {

    const auto& champion = registry_.Champion();
    const auto& encoder = registry_.Encoder();

    const auto features = ComputePaymentFeatures(txn, encoder);
    const auto row = ToModelInput(features);

    const double model_probability = champion.PredictProbability(row);
    auto heuristics = EvaluatePaymentHeuristics(txn, features[kErrorBalanceOrg]);

    auto result = Decide(model_probability, heuristics.probability,
                         std::move(heuristics.factors), champion.Name());

    // Shadow models are recorded for audit only.
    if (const auto* baseline = registry_.Baseline()) {
        LOG_INFO() << "Shadow " << baseline->Name() << " probability: "
                   << baseline->PredictProbability(row);
    }
    if (const auto* detector = registry_.AnomalyDetector()) {
        LOG_INFO() << "Shadow Isolation Forest score: " << detector->Score(row.data())
                   << (detector->IsOutlier(row.data()) ? " (outlier)" : "");
    }

    LOG_INFO() << "Primary verdict: type=" << txn.type() << " amount=" << txn.amount()
               << " model=" << model_probability << " heuristic=" << heuristics.probability
               << " final=" << result.probability()
               << " level=" << scoring::PredictionResult::RiskLevel_Name(result.risk_level());
    return result;
}

scoring::PredictionResult ScoringService::ScoreSecondary(
    const transaction::CardTransaction& txn) const {

    const auto& forest = registry_.SecondaryForest();

    const auto features = ComputeCardFeatures(txn);
    const auto row = ToModelInput(features);

    const double model_probability = forest.PredictProbability(row);
    auto heuristics = EvaluateCardHeuristics(features[kDistanceToMerchant]);

    auto result = Decide(model_probability, heuristics.probability,
                         std::move(heuristics.factors), forest.Name());

    if (const auto* detector = registry_.SecondaryAnomalyDetector()) {
        LOG_INFO() << "Shadow Isolation Forest score: " << detector->Score(row.data())
                   << (detector->IsOutlier(row.data()) ? " (outlier)" : "");
    }

    LOG_INFO() << "Secondary verdict: amt=" << txn.amt()
               << " distance_km=" << features[kDistanceToMerchant]
               << " model=" << model_probability << " final=" << result.probability();
    return result;
}

} // namespace fraud_fusion
