#pragma once

#include <memory>
#include <string>
#include <vector>

#include "artifact_store/artifact_store.hpp"
#include "category_encoding/category_encoding.hpp"
#include "ml_model/boosted_tree_model.hpp"
#include "ml_model/isolation_forest_model.hpp"
#include "ml_model/logistic_model.hpp"
#include "ml_model/random_forest_model.hpp"

namespace fraud_fusion {

// Slots are empty when the artifact is absent or failed to load.
struct LoadedArtifacts {
    std::unique_ptr<BoostedTreeModel> champion;
    std::unique_ptr<LogisticModel> baseline;
    std::unique_ptr<IsolationForestModel> anomaly_detector;
    std::unique_ptr<CategoryEncoding> encoder;
    std::unique_ptr<RandomForestModel> secondary_forest;
    std::unique_ptr<IsolationForestModel> secondary_anomaly_detector;
};

// Immutable set of artifacts built once at startup. All accessors are const
// and safe to call from any number of request threads.
class ModelRegistry {
public:
    explicit ModelRegistry(LoadedArtifacts artifacts);

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    bool Has(ArtifactKey key) const;

    // Logical names of the loaded artifacts, in kAllArtifactKeys order.
    std::vector<std::string> LoadedKeys() const;

    // Throw ArtifactMissingError when the slot is empty.
    const BoostedTreeModel& Champion() const;
    const CategoryEncoding& Encoder() const;
    const RandomForestModel& SecondaryForest() const;

    // Optional artifacts, nullptr when absent.
    const LogisticModel* Baseline() const { return artifacts_.baseline.get(); }
    const IsolationForestModel* AnomalyDetector() const { return artifacts_.anomaly_detector.get(); }
    const IsolationForestModel* SecondaryAnomalyDetector() const {
        return artifacts_.secondary_anomaly_detector.get();
    }

private:
    LoadedArtifacts artifacts_;
};

// Loads every key independently. A missing or unreadable artifact is logged
// and leaves its slot empty; the other keys are unaffected.
std::unique_ptr<ModelRegistry> LoadModelRegistry(const ArtifactStore& store);

} // namespace fraud_fusion
