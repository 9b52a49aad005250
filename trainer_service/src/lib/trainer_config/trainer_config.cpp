#include "trainer_config.hpp"

#include <exception>
#include <filesystem>
#include <string_view>

#include <fmt/format.h>

#include <userver/formats/parse/common_containers.hpp>
#include <userver/formats/yaml/serialize.hpp>
#include <userver/logging/log.hpp>

#include "errors/errors.hpp"

namespace fraud_fusion::training {

namespace {

AnomalyConfig ParseAnomaly(const userver::formats::yaml::Value& value) {
    AnomalyConfig result;
    result.n_estimators = value["n_estimators"].As<int>(result.n_estimators);
    result.max_samples = value["max_samples"].As<int>(result.max_samples);
    result.contamination = value["contamination"].As<double>(result.contamination);
    return result;
}

PrimaryPipelineConfig ParsePrimary(const userver::formats::yaml::Value& value) {
    PrimaryPipelineConfig result;
    result.dataset_path = value["dataset_path"].As<std::string>(result.dataset_path);
    result.sample_fraction = value["sample_fraction"].As<double>(result.sample_fraction);
    result.use_full_dataset = value["use_full_dataset"].As<bool>(result.use_full_dataset);
    result.fraud_capable_types =
        value["fraud_capable_types"].As<std::vector<std::string>>(result.fraud_capable_types);
    result.test_fraction = value["test_fraction"].As<double>(result.test_fraction);

    result.smote.k_neighbors = value["smote"]["k_neighbors"].As<int>(result.smote.k_neighbors);

    const auto logistic = value["logistic"];
    result.logistic.c = logistic["c"].As<double>(result.logistic.c);
    result.logistic.max_iterations = logistic["max_iterations"].As<int>(result.logistic.max_iterations);
    result.logistic.tolerance = logistic["tolerance"].As<double>(result.logistic.tolerance);

    const auto champion = value["champion"];
    result.champion.cv_folds = champion["cv_folds"].As<int>(result.champion.cv_folds);
    result.champion.search_iterations =
        champion["search_iterations"].As<int>(result.champion.search_iterations);
    result.champion.max_depth = champion["max_depth"].As<std::vector<int>>(result.champion.max_depth);
    result.champion.learning_rate =
        champion["learning_rate"].As<std::vector<double>>(result.champion.learning_rate);
    result.champion.n_estimators =
        champion["n_estimators"].As<std::vector<int>>(result.champion.n_estimators);

    if (!value["anomaly"].IsMissing()) {
        result.anomaly = ParseAnomaly(value["anomaly"]);
    }
    return result;
}

SecondaryPipelineConfig ParseSecondary(const userver::formats::yaml::Value& value) {
    SecondaryPipelineConfig result;
    result.enabled = value["enabled"].As<bool>(result.enabled);
    result.dataset_path = value["dataset_path"].As<std::string>(result.dataset_path);
    result.sample_rows = value["sample_rows"].As<int64_t>(result.sample_rows);
    result.test_fraction = value["test_fraction"].As<double>(result.test_fraction);

    const auto forest = value["forest"];
    result.forest.cv_folds = forest["cv_folds"].As<int>(result.forest.cv_folds);
    result.forest.search_iterations = forest["search_iterations"].As<int>(result.forest.search_iterations);
    result.forest.n_estimators = forest["n_estimators"].As<std::vector<int>>(result.forest.n_estimators);
    result.forest.max_depth = forest["max_depth"].As<std::vector<int>>(result.forest.max_depth);

    if (!value["anomaly"].IsMissing()) {
        result.anomaly = ParseAnomaly(value["anomaly"]);
    }
    return result;
}

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

void ValidateAnomaly(const AnomalyConfig& config, std::string_view section) {
    Require(config.n_estimators > 0, fmt::format("{}.anomaly.n_estimators must be positive", section));
    Require(config.max_samples >= 2, fmt::format("{}.anomaly.max_samples must be at least 2", section));
    Require(config.contamination > 0.0 && config.contamination < 0.5,
            fmt::format("{}.anomaly.contamination must lie in (0, 0.5)", section));
}

void ValidateDataset(const std::string& path, std::string_view hint) {
    std::error_code ec;
    Require(std::filesystem::is_regular_file(path, ec),
            fmt::format("Dataset not found at '{}'. {}", path, hint));
}

template <typename T>
void RequirePositiveList(const std::vector<T>& values, std::string_view name) {
    Require(!values.empty(), fmt::format("{} must list at least one value", name));
    for (const auto& v : values) {
        Require(v > 0, fmt::format("{} values must be positive", name));
    }
}

} // anonymous namespace

TrainerConfig Parse(const userver::formats::yaml::Value& value,
                    userver::formats::parse::To<TrainerConfig>) {
    TrainerConfig result;
    result.random_seed = value["random_seed"].As<uint64_t>(result.random_seed);
    result.worker_threads = value["worker_threads"].As<int>(result.worker_threads);
    result.artifact_dir = value["artifact_dir"].As<std::string>(result.artifact_dir);
    if (!value["primary"].IsMissing()) {
        result.primary = ParsePrimary(value["primary"]);
    }
    if (!value["secondary"].IsMissing()) {
        result.secondary = ParseSecondary(value["secondary"]);
    }
    return result;
}

void ValidateTrainerConfig(const TrainerConfig& config) {
    Require(config.worker_threads > 0, "worker_threads must be positive");
    Require(!config.artifact_dir.empty(), "artifact_dir must not be empty");

    const auto& primary = config.primary;
    Require(primary.sample_fraction > 0.0 && primary.sample_fraction <= 1.0,
            "primary.sample_fraction must lie in (0, 1]");
    Require(primary.test_fraction > 0.0 && primary.test_fraction < 1.0,
            "primary.test_fraction must lie in (0, 1)");
    Require(!primary.fraud_capable_types.empty(), "primary.fraud_capable_types must not be empty");
    Require(primary.smote.k_neighbors > 0, "primary.smote.k_neighbors must be positive");
    Require(primary.logistic.c > 0.0, "primary.logistic.c must be positive");
    Require(primary.logistic.max_iterations > 0, "primary.logistic.max_iterations must be positive");
    Require(primary.champion.cv_folds >= 2, "primary.champion.cv_folds must be at least 2");
    Require(primary.champion.search_iterations >= 0,
            "primary.champion.search_iterations must not be negative");
    RequirePositiveList(primary.champion.max_depth, "primary.champion.max_depth");
    RequirePositiveList(primary.champion.learning_rate, "primary.champion.learning_rate");
    RequirePositiveList(primary.champion.n_estimators, "primary.champion.n_estimators");
    ValidateAnomaly(primary.anomaly, "primary");

    const auto& secondary = config.secondary;
    if (secondary.enabled) {
        Require(secondary.sample_rows > 0, "secondary.sample_rows must be positive");
        Require(secondary.test_fraction > 0.0 && secondary.test_fraction < 1.0,
                "secondary.test_fraction must lie in (0, 1)");
        Require(secondary.forest.cv_folds >= 2, "secondary.forest.cv_folds must be at least 2");
        Require(secondary.forest.search_iterations >= 0,
                "secondary.forest.search_iterations must not be negative");
        RequirePositiveList(secondary.forest.n_estimators, "secondary.forest.n_estimators");
        RequirePositiveList(secondary.forest.max_depth, "secondary.forest.max_depth");
        ValidateAnomaly(secondary.anomaly, "secondary");
    }

    // Datasets last: range errors are cheaper to report first.
    ValidateDataset(primary.dataset_path,
                    "Download the PaySim dataset (onlinefraud.csv) and set primary.dataset_path.");
    if (secondary.enabled) {
        ValidateDataset(secondary.dataset_path,
                        "Download the card transactions dataset (fraudTrain.csv) and set "
                        "secondary.dataset_path, or set secondary.enabled to false.");
    }
}

TrainerConfig LoadTrainerConfig(const std::string& path) {
    TrainerConfig config;
    try {
        config = userver::formats::yaml::blocking::FromFile(path).As<TrainerConfig>();
    } catch (const std::exception& e) {
        throw ConfigurationError(fmt::format("Cannot read trainer config '{}': {}", path, e.what()));
    }
    ValidateTrainerConfig(config);
    LOG_INFO() << "Trainer config loaded from " << path << ": seed=" << config.random_seed
               << " workers=" << config.worker_threads
               << " sample_fraction=" << config.primary.EffectiveSampleFraction()
               << " secondary=" << (config.secondary.enabled ? "on" : "off");
    return config;
}

} // namespace fraud_fusion::training
