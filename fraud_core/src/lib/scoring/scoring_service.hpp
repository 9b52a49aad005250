#pragma once

#include <scoring/prediction.pb.h>
#include <transaction/transaction.pb.h>

#include "model_registry/model_registry.hpp"

namespace fraud_fusion {

// Request path glue: features, model lookup, heuristics and fusion.
// Holds no state besides the registry reference, so concurrent calls are safe.
class ScoringService {
public:
    explicit ScoringService(const ModelRegistry& registry);

    // Throws ArtifactMissingError when the champion or the encoder is absent.
    scoring::PredictionResult ScorePrimary(const transaction::PaymentTransaction& txn) const;

    // Throws ArtifactMissingError when the card-domain forest is absent.
    scoring::PredictionResult ScoreSecondary(const transaction::CardTransaction& txn) const;

private:
    const ModelRegistry& registry_;
};

} // namespace fraud_fusion
