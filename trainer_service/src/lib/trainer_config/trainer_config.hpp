#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <userver/formats/parse/to.hpp>
#include <userver/formats/yaml/value.hpp>

namespace fraud_fusion::training {

struct SmoteConfig {
    int k_neighbors = 5;
};

struct LogisticConfig {
    double c = 1.0;
    int max_iterations = 100;
    double tolerance = 1e-8;
};

// Grid of the champion booster. scale_pos_weight is not configured: the
// candidates are {1, negatives/positives} of the training split before
// oversampling.
struct ChampionSearchConfig {
    int cv_folds = 3;
    int search_iterations = 0;
    std::vector<int> max_depth = {4, 6};
    std::vector<double> learning_rate = {0.1, 0.3};
    std::vector<int> n_estimators = {100, 200};
};

struct AnomalyConfig {
    int n_estimators = 100;
    int max_samples = 256;
    double contamination = 0.01;
};

struct PrimaryPipelineConfig {
    std::string dataset_path = "data/onlinefraud.csv";
    double sample_fraction = 0.1;
    bool use_full_dataset = false;
    std::vector<std::string> fraud_capable_types = {"CASH_OUT", "TRANSFER"};
    double test_fraction = 0.2;
    SmoteConfig smote;
    LogisticConfig logistic;
    ChampionSearchConfig champion;
    AnomalyConfig anomaly;

    // use_full_dataset wins over sample_fraction.
    double EffectiveSampleFraction() const { return use_full_dataset ? 1.0 : sample_fraction; }
};

struct ForestSearchConfig {
    int cv_folds = 3;
    int search_iterations = 3;
    std::vector<int> n_estimators = {50, 100};
    std::vector<int> max_depth = {5, 10};
};

struct SecondaryPipelineConfig {
    bool enabled = false;
    std::string dataset_path = "data/fraudTrain.csv";
    int64_t sample_rows = 100000;
    double test_fraction = 0.2;
    ForestSearchConfig forest;
    AnomalyConfig anomaly;
};

struct TrainerConfig {
    uint64_t random_seed = 42;
    int worker_threads = 4;
    std::string artifact_dir = "models";
    PrimaryPipelineConfig primary;
    SecondaryPipelineConfig secondary;
};

TrainerConfig Parse(const userver::formats::yaml::Value& value,
                    userver::formats::parse::To<TrainerConfig>);

// Reads and validates the YAML file. Throws ConfigurationError.
TrainerConfig LoadTrainerConfig(const std::string& path);

// Checks value ranges and dataset presence before any computation starts.
// Throws ConfigurationError with a remediation hint.
void ValidateTrainerConfig(const TrainerConfig& config);

} // namespace fraud_fusion::training
