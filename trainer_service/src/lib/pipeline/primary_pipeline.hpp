#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "artifact_store/artifact_store.hpp"
#include "category_encoding/category_encoding.hpp"
#include "dataset/labeled_matrix.hpp"
#include "dataset/transaction_dataset.hpp"
#include "model_trainers/boosted_tree_trainer.hpp"
#include "pipeline/evaluation.hpp"
#include "trainer_config/trainer_config.hpp"

namespace fraud_fusion::training {

struct PaymentSample {
    std::vector<PaymentRecord> records;
    std::size_t rows_read = 0;
};

struct PrimaryTrainingReport {
    std::size_t rows_read = 0;
    std::size_t rows_sampled = 0;
    std::size_t rows_filtered = 0;
    std::size_t train_rows = 0;
    std::size_t test_rows = 0;
    std::size_t balanced_rows = 0;
    std::vector<std::string> categories;
    BoostedTreeParams champion_params;
    double champion_cv_auprc = 0.0;
    std::vector<ModelEvaluation> evaluations;
};

// Every fraud row plus a seeded Bernoulli sample of legitimate rows.
PaymentSample SamplePayments(const PrimaryPipelineConfig& config, uint64_t seed);

std::vector<PaymentRecord> FilterFraudCapable(std::vector<PaymentRecord> records,
                                              const std::vector<std::string>& types);

// Rows go through the same transform the scoring path uses.
LabeledMatrix BuildPaymentMatrix(const std::vector<PaymentRecord>& records,
                                 const CategoryEncoding& encoding);

// max_depth x learning_rate x n_estimators x {1, imbalance_ratio}.
std::vector<BoostedTreeParams> BuildChampionGrid(const ChampionSearchConfig& config,
                                                 double imbalance_ratio,
                                                 uint64_t seed);

// Filter, encode, split, oversample, train the three models, evaluate and
// write every artifact. Must run inside the userver engine.
PrimaryTrainingReport TrainPrimaryModels(std::vector<PaymentRecord> records,
                                         const TrainerConfig& config,
                                         const ArtifactStore& store);

// Columns sidecar, then the champion model file.
void WriteChampionArtifact(const ArtifactStore& store, const BoostedTreeModel& champion);

PrimaryTrainingReport RunPrimaryPipeline(const TrainerConfig& config, const ArtifactStore& store);

} // namespace fraud_fusion::training
