#include "model_registry.hpp"

#include <exception>
#include <string_view>

#include <userver/logging/log.hpp>

#include "errors/errors.hpp"
#include "feature_engineer/card_features.hpp"
#include "feature_engineer/payment_features.hpp"

namespace fraud_fusion {

namespace {

// Refuses a model whose sidecar column list differs from the live transform.
bool ColumnsMatch(const ArtifactStore& store, ArtifactKey key,
                  const std::vector<std::string_view>& expected) {
    auto columns = store.ReadColumns(key);
    if (!columns) {
        LOG_ERROR() << "Cannot read feature columns for " << ToString(key)
                    << " from " << store.ColumnsPath(key);
        return false;
    }
    if (columns->size() != expected.size()) {
        LOG_ERROR() << "Feature count mismatch for " << ToString(key) << ": artifact has "
                    << columns->size() << ", expected " << expected.size();
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if ((*columns)[i] != expected[i]) {
            LOG_ERROR() << "Feature column " << i << " mismatch for " << ToString(key)
                        << ": artifact has '" << (*columns)[i] << "', expected '" << expected[i] << "'";
            return false;
        }
    }
    return true;
}

bool NamesMatch(ArtifactKey key, const std::vector<std::string>& names,
                const std::vector<std::string_view>& expected) {
    if (names.size() != expected.size()) {
        LOG_ERROR() << "Feature count mismatch inside " << ToString(key);
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (names[i] != expected[i]) {
            LOG_ERROR() << "Feature '" << names[i] << "' inside " << ToString(key)
                        << " does not match '" << expected[i] << "'";
            return false;
        }
    }
    return true;
}

bool Present(const ArtifactStore& store, ArtifactKey key) {
    if (!store.Exists(key)) {
        LOG_WARNING() << "Artifact " << ToString(key) << " not found at " << store.ModelPath(key)
                      << ", its request path stays disabled";
        return false;
    }
    return true;
}

std::unique_ptr<BoostedTreeModel> LoadChampion(const ArtifactStore& store) {
    const auto key = ArtifactKey::kChampion;
    if (!Present(store, key) || !ColumnsMatch(store, key, PaymentFeatureNames())) {
        return nullptr;
    }
    auto model = std::make_unique<BoostedTreeModel>();
    if (!model->LoadFromFile(store.ModelPath(key))) {
        return nullptr;
    }
    return model;
}

std::unique_ptr<RandomForestModel> LoadSecondaryForest(const ArtifactStore& store) {
    const auto key = ArtifactKey::kSecondaryForest;
    if (!Present(store, key) || !ColumnsMatch(store, key, CardFeatureNames())) {
        return nullptr;
    }
    auto model = std::make_unique<RandomForestModel>();
    if (!model->LoadFromFile(store.ModelPath(key))) {
        return nullptr;
    }
    return model;
}

std::unique_ptr<LogisticModel> LoadBaseline(const ArtifactStore& store) {
    const auto key = ArtifactKey::kBaseline;
    models::LogisticModel proto;
    if (!Present(store, key) || !store.ReadMessage(key, proto)) {
        return nullptr;
    }
    try {
        auto model = std::make_unique<LogisticModel>(LogisticModel::FromProto(proto));
        if (!NamesMatch(key, model->FeatureNames(), PaymentFeatureNames())) {
            return nullptr;
        }
        return model;
    } catch (const std::exception& e) {
        LOG_ERROR() << "Invalid " << ToString(key) << " artifact: " << e.what();
        return nullptr;
    }
}

std::unique_ptr<IsolationForestModel> LoadAnomalyDetector(
    const ArtifactStore& store, ArtifactKey key, const std::vector<std::string_view>& expected) {
    models::IsolationForest proto;
    if (!Present(store, key) || !store.ReadMessage(key, proto)) {
        return nullptr;
    }
    try {
        auto model = std::make_unique<IsolationForestModel>(IsolationForestModel::FromProto(proto));
        if (!NamesMatch(key, model->FeatureNames(), expected)) {
            return nullptr;
        }
        return model;
    } catch (const std::exception& e) {
        LOG_ERROR() << "Invalid " << ToString(key) << " artifact: " << e.what();
        return nullptr;
    }
}

std::unique_ptr<CategoryEncoding> LoadEncoder(const ArtifactStore& store) {
    const auto key = ArtifactKey::kCategoryEncoder;
    models::CategoryEncoding proto;
    if (!Present(store, key) || !store.ReadMessage(key, proto)) {
        return nullptr;
    }
    try {
        return std::make_unique<CategoryEncoding>(CategoryEncoding::FromProto(proto));
    } catch (const std::exception& e) {
        LOG_ERROR() << "Invalid " << ToString(key) << " artifact: " << e.what();
        return nullptr;
    }
}

} // anonymous namespace

ModelRegistry::ModelRegistry(LoadedArtifacts artifacts)
    : artifacts_(std::move(artifacts)) {}

bool ModelRegistry::Has(ArtifactKey key) const {
    switch (key) {
        case ArtifactKey::kChampion:
            return artifacts_.champion != nullptr;
        case ArtifactKey::kBaseline:
            return artifacts_.baseline != nullptr;
        case ArtifactKey::kAnomalyDetector:
            return artifacts_.anomaly_detector != nullptr;
        case ArtifactKey::kCategoryEncoder:
            return artifacts_.encoder != nullptr;
        case ArtifactKey::kSecondaryForest:
            return artifacts_.secondary_forest != nullptr;
        case ArtifactKey::kSecondaryAnomalyDetector:
            return artifacts_.secondary_anomaly_detector != nullptr;
    }
    return false;
}

std::vector<std::string> ModelRegistry::LoadedKeys() const {
    std::vector<std::string> keys;
    for (auto key : kAllArtifactKeys) {
        if (Has(key)) {
            keys.emplace_back(ToString(key));
        }
    }
    return keys;
}

const BoostedTreeModel& ModelRegistry::Champion() const {
    if (!artifacts_.champion) {
        throw ArtifactMissingError(std::string(ToString(ArtifactKey::kChampion)));
    }
    return *artifacts_.champion;
}

const CategoryEncoding& ModelRegistry::Encoder() const {
    if (!artifacts_.encoder) {
        throw ArtifactMissingError(std::string(ToString(ArtifactKey::kCategoryEncoder)));
    }
    return *artifacts_.encoder;
}

const RandomForestModel& ModelRegistry::SecondaryForest() const {
    if (!artifacts_.secondary_forest) {
        throw ArtifactMissingError(std::string(ToString(ArtifactKey::kSecondaryForest)));
    }
    return *artifacts_.secondary_forest;
}

std::unique_ptr<ModelRegistry> LoadModelRegistry(const ArtifactStore& store) {
    LOG_INFO() << "Loading artifacts from " << store.Directory();

    LoadedArtifacts artifacts;
    artifacts.champion = LoadChampion(store);
    artifacts.baseline = LoadBaseline(store);
    artifacts.anomaly_detector = LoadAnomalyDetector(
        store, ArtifactKey::kAnomalyDetector, PaymentFeatureNames());
    artifacts.encoder = LoadEncoder(store);
    artifacts.secondary_forest = LoadSecondaryForest(store);
    artifacts.secondary_anomaly_detector = LoadAnomalyDetector(
        store, ArtifactKey::kSecondaryAnomalyDetector, CardFeatureNames());

    auto registry = std::make_unique<ModelRegistry>(std::move(artifacts));
    const auto loaded = registry->LoadedKeys();
    LOG_INFO() << "Artifacts loaded: " << loaded.size() << "/" << kAllArtifactKeys.size();
    return registry;
}

} // namespace fraud_fusion
