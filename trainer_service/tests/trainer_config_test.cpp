#include <userver/formats/yaml/serialize.hpp>
#include <userver/fs/blocking/temp_directory.hpp>
#include <userver/fs/blocking/write.hpp>
#include <userver/utest/utest.hpp>

#include "errors/errors.hpp"
#include "trainer_config/trainer_config.hpp"

namespace fraud_fusion::training {

namespace {

TrainerConfig FromYaml(const std::string& text) {
    return userver::formats::yaml::FromString(text).As<TrainerConfig>();
}

} // anonymous namespace

TEST(TrainerConfig, DefaultsWhenSectionsAreMissing) {
    const auto config = FromYaml("random_seed: 7\n");
    EXPECT_EQ(config.random_seed, 7u);
    EXPECT_EQ(config.worker_threads, 4);
    EXPECT_EQ(config.artifact_dir, "models");
    EXPECT_DOUBLE_EQ(config.primary.sample_fraction, 0.1);
    EXPECT_EQ(config.primary.fraud_capable_types, (std::vector<std::string>{"CASH_OUT", "TRANSFER"}));
    EXPECT_EQ(config.primary.smote.k_neighbors, 5);
    EXPECT_EQ(config.primary.champion.cv_folds, 3);
    EXPECT_FALSE(config.secondary.enabled);
    EXPECT_EQ(config.secondary.sample_rows, 100000);
}

TEST(TrainerConfig, ParsesNestedSections) {
    const auto config = FromYaml(R"(
artifact_dir: /var/lib/fraud/models
primary:
  dataset_path: /data/paysim.csv
  use_full_dataset: true
  sample_fraction: 0.5
  champion:
    max_depth: [3]
    learning_rate: [0.05, 0.1]
  anomaly:
    contamination: 0.02
secondary:
  enabled: true
  sample_rows: 500
  forest:
    n_estimators: [10]
)");
    EXPECT_EQ(config.artifact_dir, "/var/lib/fraud/models");
    EXPECT_EQ(config.primary.dataset_path, "/data/paysim.csv");
    EXPECT_DOUBLE_EQ(config.primary.EffectiveSampleFraction(), 1.0);
    EXPECT_EQ(config.primary.champion.max_depth, std::vector<int>{3});
    EXPECT_EQ(config.primary.champion.learning_rate.size(), 2u);
    EXPECT_EQ(config.primary.champion.n_estimators, (std::vector<int>{100, 200}));
    EXPECT_DOUBLE_EQ(config.primary.anomaly.contamination, 0.02);
    EXPECT_EQ(config.primary.anomaly.max_samples, 256);
    EXPECT_TRUE(config.secondary.enabled);
    EXPECT_EQ(config.secondary.sample_rows, 500);
    EXPECT_EQ(config.secondary.forest.n_estimators, std::vector<int>{10});
    EXPECT_EQ(config.secondary.forest.max_depth, (std::vector<int>{5, 10}));
}

TEST(TrainerConfig, MissingDatasetNamesThePath) {
    TrainerConfig config;
    config.primary.dataset_path = "/nonexistent/onlinefraud.csv";
    try {
        ValidateTrainerConfig(config);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/onlinefraud.csv"), std::string::npos);
    }
}

TEST(TrainerConfig, RangeChecks) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto dataset = dir.GetPath() + "/onlinefraud.csv";
    userver::fs::blocking::RewriteFileContents(dataset, "step,type\n");

    TrainerConfig config;
    config.primary.dataset_path = dataset;
    EXPECT_NO_THROW(ValidateTrainerConfig(config));

    auto bad = config;
    bad.primary.sample_fraction = 0.0;
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);

    bad = config;
    bad.primary.test_fraction = 1.0;
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);

    bad = config;
    bad.primary.champion.cv_folds = 1;
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);

    bad = config;
    bad.primary.champion.learning_rate.clear();
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);

    bad = config;
    bad.primary.anomaly.contamination = 0.5;
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);

    // The card dataset is only required when the secondary path is on.
    bad = config;
    bad.secondary.dataset_path = "/nonexistent/fraudTrain.csv";
    EXPECT_NO_THROW(ValidateTrainerConfig(bad));
    bad.secondary.enabled = true;
    EXPECT_THROW(ValidateTrainerConfig(bad), ConfigurationError);
}

TEST(TrainerConfig, LoadWrapsParseErrors) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto path = dir.GetPath() + "/trainer.yaml";
    userver::fs::blocking::RewriteFileContents(path, "random_seed: [not, a, number]\n");
    EXPECT_THROW(LoadTrainerConfig(path), ConfigurationError);
    EXPECT_THROW(LoadTrainerConfig(dir.GetPath() + "/missing.yaml"), ConfigurationError);
}

} // namespace fraud_fusion::training
