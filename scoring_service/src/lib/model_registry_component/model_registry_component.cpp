#include "model_registry_component.hpp"

#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "artifact_store/artifact_store.hpp"

namespace fraud_fusion {

ModelRegistryComponent::ModelRegistryComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : LoggableComponentBase(config, context),
      registry_(LoadModelRegistry(ArtifactStore(config["model_dir"].As<std::string>("models")))),
      scoring_(*registry_) {
    if (!registry_->Has(ArtifactKey::kChampion) || !registry_->Has(ArtifactKey::kCategoryEncoder)) {
        LOG_WARNING() << "Primary scoring disabled until the champion and encoder are trained";
    }
    if (!registry_->Has(ArtifactKey::kSecondaryForest)) {
        LOG_WARNING() << "Secondary scoring disabled until the card model is trained";
    }
}

userver::yaml_config::Schema ModelRegistryComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::LoggableComponentBase>(R"(
type: object
description: Trained fraud model artifacts
additionalProperties: false
properties:
    model_dir:
        type: string
        description: Directory the trainer wrote its artifacts to
        defaultDescription: models
)");
}

} // namespace fraud_fusion
