#include <exception>
#include <iostream>

#include <google/protobuf/stubs/common.h>

#include <userver/engine/run_standalone.hpp>
#include <userver/logging/log.hpp>
#include <userver/logging/logger.hpp>

#include "artifact_store/artifact_store.hpp"
#include "errors/errors.hpp"
#include "pipeline/primary_pipeline.hpp"
#include "pipeline/secondary_pipeline.hpp"
#include "trainer_config/trainer_config.hpp"

namespace training = fraud_fusion::training;

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <trainer.yaml>\n";
        return 2;
    }

    userver::logging::DefaultLoggerGuard logger_guard{userver::logging::MakeStderrLogger(
        "default", userver::logging::Format::kTskv, userver::logging::Level::kInfo)};

    training::TrainerConfig config;
    try {
        config = training::LoadTrainerConfig(argv[1]);
    } catch (const fraud_fusion::ConfigurationError& e) {
        LOG_ERROR() << "Configuration error: " << e.what();
        return 1;
    }

    int exit_code = 0;
    userver::engine::RunStandalone(static_cast<std::size_t>(config.worker_threads), [&] {
        try {
            const fraud_fusion::ArtifactStore store(config.artifact_dir);
            training::RunPrimaryPipeline(config, store);
            if (config.secondary.enabled) {
                training::RunSecondaryPipeline(config, store);
            }
            LOG_INFO() << "Training finished, artifacts written to " << config.artifact_dir;
        } catch (const std::exception& e) {
            LOG_ERROR() << "Training aborted: " << e.what();
            exit_code = 1;
        }
    });

    google::protobuf::ShutdownProtobufLibrary();
    return exit_code;
}
