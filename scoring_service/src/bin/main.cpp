#include <userver/components/minimal_server_component_list.hpp>
#include <userver/utils/daemon_run.hpp>

#include <google/protobuf/stubs/common.h>

#include "handlers/health_handler.hpp"
#include "handlers/predict_handlers.hpp"
#include "model_registry_component/model_registry_component.hpp"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list =
        userver::components::MinimalServerComponentList()
            .Append<fraud_fusion::ModelRegistryComponent>()
            .Append<fraud_fusion::PredictPrimaryHandler>()
            .Append<fraud_fusion::PredictSecondaryHandler>()
            .Append<fraud_fusion::HealthHandler>();

    return userver::utils::DaemonMain(argc, argv, component_list);
}
