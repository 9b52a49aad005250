#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "artifact_store/artifact_store.hpp"
#include "dataset/labeled_matrix.hpp"
#include "dataset/transaction_dataset.hpp"
#include "model_trainers/random_forest_trainer.hpp"
#include "pipeline/evaluation.hpp"
#include "trainer_config/trainer_config.hpp"

namespace fraud_fusion::training {

struct SecondaryTrainingReport {
    std::size_t rows_read = 0;
    std::size_t rows_sampled = 0;
    std::size_t train_rows = 0;
    std::size_t test_rows = 0;
    RandomForestParams forest_params;
    double forest_cv_auprc = 0.0;
    ModelEvaluation forest;
    ModelEvaluation anomaly_detector;
};

struct CardSample {
    std::vector<CardRecord> records;
    std::size_t rows_read = 0;
};

// Seeded reservoir sample of `sample_rows` card transactions.
CardSample SampleCards(const SecondaryPipelineConfig& config, uint64_t seed);

LabeledMatrix BuildCardMatrix(const std::vector<CardRecord>& records);

// n_estimators x max_depth.
std::vector<RandomForestParams> BuildForestGrid(const ForestSearchConfig& config, uint64_t seed);

// Split, search, refit, evaluate, fit the card anomaly detector and write
// both artifacts. Must run inside the userver engine.
SecondaryTrainingReport TrainSecondaryModels(const std::vector<CardRecord>& records,
                                             const TrainerConfig& config,
                                             const ArtifactStore& store);

SecondaryTrainingReport RunSecondaryPipeline(const TrainerConfig& config, const ArtifactStore& store);

} // namespace fraud_fusion::training
