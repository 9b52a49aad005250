#include "secondary_pipeline.hpp"

#include <stdexcept>

#include <userver/logging/log.hpp>

#include "feature_engineer/card_features.hpp"
#include "model_interface/IProbabilityModel.hpp"
#include "model_search/hyperparameter_search.hpp"
#include "model_trainers/isolation_forest_trainer.hpp"
#include "sampling/row_sampler.hpp"
#include "sampling/stratified_split.hpp"

namespace fraud_fusion::training {

CardSample SampleCards(const SecondaryPipelineConfig& config, uint64_t seed) {
    ReservoirSampler<CardRecord> reservoir(static_cast<std::size_t>(config.sample_rows), seed);
    CardSample sample;
    sample.rows_read = ReadCardDataset(config.dataset_path, [&reservoir](CardRecord&& record) {
        reservoir.Offer(std::move(record));
    });
    sample.records = reservoir.Release();
    LOG_INFO() << "Sampled " << sample.records.size() << " of " << sample.rows_read << " card rows";
    return sample;
}

LabeledMatrix BuildCardMatrix(const std::vector<CardRecord>& records) {
    LabeledMatrix matrix(kCardFeatureCount);
    matrix.Reserve(records.size());
    for (const auto& record : records) {
        matrix.AppendRow(ToModelInput(ComputeCardFeatures(record.txn)), record.is_fraud);
    }
    return matrix;
}

std::vector<RandomForestParams> BuildForestGrid(const ForestSearchConfig& config, uint64_t seed) {
    std::vector<RandomForestParams> grid;
    for (int trees : config.n_estimators) {
        for (int depth : config.max_depth) {
            RandomForestParams params;
            params.n_estimators = trees;
            params.max_depth = depth;
            params.seed = seed;
            grid.push_back(params);
        }
    }
    return grid;
}

SecondaryTrainingReport TrainSecondaryModels(const std::vector<CardRecord>& records,
                                             const TrainerConfig& config,
                                             const ArtifactStore& store) {
    const auto& secondary = config.secondary;
    const uint64_t seed = config.random_seed;
    SecondaryTrainingReport report;
    report.rows_sampled = records.size();

    const auto matrix = BuildCardMatrix(records);
    if (matrix.CountLabel(1) == 0) {
        throw std::runtime_error("Card sample contains no fraud rows");
    }

    const auto split = StratifiedSplit(matrix.Labels(), secondary.test_fraction, seed);
    const auto train = matrix.Select(split.train);
    const auto test = matrix.Select(split.test);
    report.train_rows = train.Rows();
    report.test_rows = test.Rows();
    LOG_INFO() << "Card split: " << train.Rows() << " train (" << train.CountLabel(1) << " fraud), "
               << test.Rows() << " test (" << test.CountLabel(1) << " fraud)";

    const auto grid = BuildForestGrid(secondary.forest, seed);
    const auto candidates = SelectCandidates(grid.size(), secondary.forest.search_iterations, seed);
    LOG_INFO() << "Training card model: Random Forest, " << candidates.size() << " of "
               << grid.size() << " candidates x " << secondary.forest.cv_folds << " folds";

    const auto search = CrossValidatedSearch(
        train, candidates, secondary.forest.cv_folds,
        [&grid](std::size_t candidate, const LabeledMatrix& fit, const LabeledMatrix& validation) {
            const auto model = TrainRandomForest(fit, grid[candidate]);
            return model.PredictBatch(validation.Values(), validation.NumFeatures());
        });
    report.forest_params = grid[search.best_candidate];
    report.forest_cv_auprc = search.best_score;
    LOG_INFO() << "Best card model params: " << Describe(report.forest_params)
               << " (cv AUPRC " << search.best_score << ")";

    auto refit_params = report.forest_params;
    refit_params.num_threads = config.worker_threads;
    const auto forest = TrainRandomForest(train, refit_params);

    IsolationForestParams iso_params;
    iso_params.n_estimators = secondary.anomaly.n_estimators;
    iso_params.max_samples = secondary.anomaly.max_samples;
    iso_params.contamination = secondary.anomaly.contamination;
    iso_params.seed = seed;
    const auto anomaly_detector =
        FitIsolationForest(train.Values(), train.NumFeatures(), CardFeatureNames(), iso_params);

    const auto& y_test = test.Labels();
    const auto forest_probs = forest.PredictBatch(test.Values(), test.NumFeatures());
    const auto anomaly_scores = anomaly_detector.ScoreBatch(test.Values(), test.NumFeatures());
    report.forest = Evaluate("random_forest", y_test, forest_probs, ToPredictions(forest_probs));
    report.anomaly_detector = Evaluate("isolation_forest", y_test, anomaly_scores,
                                       ToPredictions(anomaly_scores, anomaly_detector.Proto().score_threshold()));

    LogEvaluationTable("Card models on the held-out split", {report.forest, report.anomaly_detector});
    LogConfusionMatrix(report.forest);

    store.WriteColumns(ArtifactKey::kSecondaryForest, CardFeatureNames());
    store.Replace(ArtifactKey::kSecondaryForest,
                  [&forest](const std::string& path) { forest.SaveToFile(path); });
    store.WriteMessage(ArtifactKey::kSecondaryAnomalyDetector, anomaly_detector.Proto());
    return report;
}

SecondaryTrainingReport RunSecondaryPipeline(const TrainerConfig& config, const ArtifactStore& store) {
    const auto sample = SampleCards(config.secondary, config.random_seed);
    auto report = TrainSecondaryModels(sample.records, config, store);
    report.rows_read = sample.rows_read;
    return report;
}

} // namespace fraud_fusion::training
