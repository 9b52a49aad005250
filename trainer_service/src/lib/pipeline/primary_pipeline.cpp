#include "primary_pipeline.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <userver/logging/log.hpp>

#include "feature_engineer/payment_features.hpp"
#include "model_interface/IProbabilityModel.hpp"
#include "model_search/hyperparameter_search.hpp"
#include "model_trainers/isolation_forest_trainer.hpp"
#include "model_trainers/logistic_trainer.hpp"
#include "oversampling/smote.hpp"
#include "sampling/row_sampler.hpp"
#include "sampling/stratified_split.hpp"

namespace fraud_fusion::training {

namespace {

void LogClassDistribution(std::string_view stage, std::size_t fraud, std::size_t total) {
    const double ratio = total > 0 ? 100.0 * static_cast<double>(fraud) / static_cast<double>(total) : 0.0;
    LOG_INFO() << fmt::format("{}: {} rows, {} fraud ({:.4f}%)", stage, total, fraud, ratio);
}

void WriteArtifacts(const ArtifactStore& store,
                    const BoostedTreeModel& champion,
                    const LogisticModel& baseline,
                    const IsolationForestModel& anomaly_detector,
                    const CategoryEncoding& encoding) {
    WriteChampionArtifact(store, champion);
    store.WriteMessage(ArtifactKey::kBaseline, baseline.Proto());
    store.WriteMessage(ArtifactKey::kAnomalyDetector, anomaly_detector.Proto());
    store.WriteMessage(ArtifactKey::kCategoryEncoder, encoding.ToProto());
}

} // anonymous namespace

void WriteChampionArtifact(const ArtifactStore& store, const BoostedTreeModel& champion) {
    // Columns land first so a champion file never appears without them.
    store.WriteColumns(ArtifactKey::kChampion, PaymentFeatureNames());
    store.Replace(ArtifactKey::kChampion,
                  [&champion](const std::string& path) { champion.SaveToFile(path); });
}

PaymentSample SamplePayments(const PrimaryPipelineConfig& config, uint64_t seed) {
    const double fraction = config.EffectiveSampleFraction();
    LOG_INFO() << "Sampling " << config.dataset_path << ": keeping all fraud rows and "
               << fraction * 100.0 << "% of legitimate rows";

    ClassAwareSampler sampler(fraction, seed);
    PaymentSample sample;
    sample.rows_read = ReadPaymentDataset(config.dataset_path, [&](PaymentRecord&& record) {
        if (sampler.Keep(record.is_fraud)) {
            sample.records.push_back(std::move(record));
        }
    });
    LogClassDistribution("Sampled", sampler.KeptFraud(), sample.records.size());
    return sample;
}

std::vector<PaymentRecord> FilterFraudCapable(std::vector<PaymentRecord> records,
                                              const std::vector<std::string>& types) {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&types](const PaymentRecord& r) {
                                     return std::find(types.begin(), types.end(), r.txn.type()) == types.end();
                                 }),
                  records.end());
    return records;
}

LabeledMatrix BuildPaymentMatrix(const std::vector<PaymentRecord>& records,
                                 const CategoryEncoding& encoding) {
    LabeledMatrix matrix(kPaymentFeatureCount);
    matrix.Reserve(records.size());
    for (const auto& record : records) {
        matrix.AppendRow(ToModelInput(ComputePaymentFeatures(record.txn, encoding)), record.is_fraud);
    }
    return matrix;
}

std::vector<BoostedTreeParams> BuildChampionGrid(const ChampionSearchConfig& config,
                                                 double imbalance_ratio,
                                                 uint64_t seed) {
    std::vector<double> weights = {1.0};
    if (imbalance_ratio != 1.0) {
        weights.push_back(imbalance_ratio);
    }

    std::vector<BoostedTreeParams> grid;
    for (int depth : config.max_depth) {
        for (double lr : config.learning_rate) {
            for (int trees : config.n_estimators) {
                for (double weight : weights) {
                    BoostedTreeParams params;
                    params.max_depth = depth;
                    params.learning_rate = lr;
                    params.n_estimators = trees;
                    params.scale_pos_weight = weight;
                    params.seed = seed;
                    grid.push_back(params);
                }
            }
        }
    }
    return grid;
}

PrimaryTrainingReport TrainPrimaryModels(std::vector<PaymentRecord> records,
                                         const TrainerConfig& config,
                                         const ArtifactStore& store) {
    const auto& primary = config.primary;
    const uint64_t seed = config.random_seed;
    PrimaryTrainingReport report;
    report.rows_sampled = records.size();

    // Filtering and features
    records = FilterFraudCapable(std::move(records), primary.fraud_capable_types);
    report.rows_filtered = records.size();
    if (records.empty()) {
        throw std::runtime_error("No rows left after filtering to fraud-capable types");
    }
    std::vector<std::string> labels;
    labels.reserve(records.size());
    for (const auto& r : records) {
        labels.push_back(r.txn.type());
    }
    const auto encoding = CategoryEncoding::Fit(std::move(labels));
    report.categories = encoding.Classes();
    LOG_INFO() << "Encoded " << encoding.Classes().size() << " transaction types: "
               << fmt::format("{}", fmt::join(encoding.Classes(), ", "));

    const auto matrix = BuildPaymentMatrix(records, encoding);
    records.clear();
    records.shrink_to_fit();
    LogClassDistribution("Filtered", matrix.CountLabel(1), matrix.Rows());

    // Split
    const auto split = StratifiedSplit(matrix.Labels(), primary.test_fraction, seed);
    const auto train = matrix.Select(split.train);
    const auto test = matrix.Select(split.test);
    report.train_rows = train.Rows();
    report.test_rows = test.Rows();
    LogClassDistribution("Train split", train.CountLabel(1), train.Rows());
    LogClassDistribution("Test split", test.CountLabel(1), test.Rows());

    // Oversampling, training split only
    const auto balanced = Smote(train, primary.smote.k_neighbors, seed);
    report.balanced_rows = balanced.Rows();
    LogClassDistribution("After SMOTE", balanced.CountLabel(1), balanced.Rows());

    const auto feature_names = PaymentFeatureNames();

    // Baseline
    LOG_INFO() << "Training baseline: Logistic Regression";
    const auto baseline = FitLogistic(balanced, primary.logistic, feature_names);

    // Champion
    const double positives = static_cast<double>(train.CountLabel(1));
    const double imbalance_ratio = (static_cast<double>(train.Rows()) - positives) / std::max(positives, 1.0);
    const auto grid = BuildChampionGrid(primary.champion, imbalance_ratio, seed);
    const auto candidates = SelectCandidates(grid.size(), primary.champion.search_iterations, seed);
    LOG_INFO() << "Training champion: XGBoost, " << candidates.size() << " of " << grid.size()
               << " candidates x " << primary.champion.cv_folds << " folds (scale_pos_weight "
               << imbalance_ratio << ")";

    const auto search = CrossValidatedSearch(
        balanced, candidates, primary.champion.cv_folds,
        [&grid](std::size_t candidate, const LabeledMatrix& fit, const LabeledMatrix& validation) {
            const auto model = TrainBoostedTree(fit, grid[candidate]);
            return model.PredictBatch(validation.Values(), validation.NumFeatures());
        });
    report.champion_params = grid[search.best_candidate];
    report.champion_cv_auprc = search.best_score;
    LOG_INFO() << "Best champion params: " << Describe(report.champion_params)
               << " (cv AUPRC " << search.best_score << ")";

    auto refit_params = report.champion_params;
    refit_params.nthread = config.worker_threads;
    const auto champion = TrainBoostedTree(balanced, refit_params);

    // Anomaly detector on legitimate rows only, labels unused.
    IsolationForestParams iso_params;
    iso_params.n_estimators = primary.anomaly.n_estimators;
    iso_params.max_samples = primary.anomaly.max_samples;
    iso_params.contamination = primary.anomaly.contamination;
    iso_params.seed = seed;
    const auto legit_rows = train.RowsWithLabel(0);
    LOG_INFO() << "Training anomaly detector: Isolation Forest on "
               << legit_rows.size() / train.NumFeatures() << " legitimate rows";
    const auto anomaly_detector = FitIsolationForest(legit_rows, train.NumFeatures(), feature_names, iso_params);

    // Evaluation on the held-out split
    const auto& y_test = test.Labels();
    const auto baseline_probs = baseline.PredictBatch(test.Values(), test.NumFeatures());
    const auto champion_probs = champion.PredictBatch(test.Values(), test.NumFeatures());
    const auto anomaly_scores = anomaly_detector.ScoreBatch(test.Values(), test.NumFeatures());

    report.evaluations.push_back(Evaluate("logistic_regression", y_test, baseline_probs,
                                          ToPredictions(baseline_probs)));
    report.evaluations.push_back(Evaluate("xgboost", y_test, champion_probs,
                                          ToPredictions(champion_probs)));
    report.evaluations.push_back(Evaluate("isolation_forest", y_test, anomaly_scores,
                                          ToPredictions(anomaly_scores, anomaly_detector.Proto().score_threshold())));

    LogEvaluationTable("Primary models on the held-out split", report.evaluations);
    LogConfusionMatrix(report.evaluations[1]);

    WriteArtifacts(store, champion, baseline, anomaly_detector, encoding);
    return report;
}

PrimaryTrainingReport RunPrimaryPipeline(const TrainerConfig& config, const ArtifactStore& store) {
    auto sample = SamplePayments(config.primary, config.random_seed);
    auto report = TrainPrimaryModels(std::move(sample.records), config, store);
    report.rows_read = sample.rows_read;
    return report;
}

} // namespace fraud_fusion::training
