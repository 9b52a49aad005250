#pragma once

#include <memory>
#include <string_view>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/loggable_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include "model_registry/model_registry.hpp"
#include "scoring/scoring_service.hpp"

namespace fraud_fusion {

// Loads every artifact from `model_dir` once, in the constructor. Handlers
// look this component up, so they are only built after loading completed.
class ModelRegistryComponent final : public userver::components::LoggableComponentBase {
public:
    static constexpr std::string_view kName = "model-registry";

    ModelRegistryComponent(const userver::components::ComponentConfig& config,
                           const userver::components::ComponentContext& context);

    ModelRegistryComponent(const ModelRegistryComponent&) = delete;
    ModelRegistryComponent& operator=(const ModelRegistryComponent&) = delete;

    const ModelRegistry& GetRegistry() const { return *registry_; }
    const ScoringService& GetScoringService() const { return scoring_; }

    static userver::yaml_config::Schema GetStaticConfigSchema();

private:
    std::unique_ptr<ModelRegistry> registry_;
    ScoringService scoring_;
};

} // namespace fraud_fusion
