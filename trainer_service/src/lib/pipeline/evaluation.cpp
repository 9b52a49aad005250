#include "evaluation.hpp"

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace fraud_fusion::training {

ModelEvaluation Evaluate(std::string model,
                         const std::vector<int>& labels,
                         const std::vector<double>& scores,
                         const std::vector<int>& predictions) {
    ModelEvaluation evaluation;
    evaluation.model = std::move(model);
    evaluation.auprc = AveragePrecision(labels, scores);
    evaluation.confusion = ComputeConfusionMatrix(labels, predictions);
    evaluation.f1 = evaluation.confusion.F1();
    return evaluation;
}

void LogEvaluationTable(std::string_view title, const std::vector<ModelEvaluation>& evaluations) {
    LOG_INFO() << title;
    LOG_INFO() << fmt::format("{:<25} {:<10} {:<10}", "Model", "AUPRC", "F1-Score");
    for (const auto& e : evaluations) {
        LOG_INFO() << fmt::format("{:<25} {:<10.4f} {:<10.4f}", e.model, e.auprc, e.f1);
    }
}

void LogConfusionMatrix(const ModelEvaluation& e) {
    const auto& m = e.confusion;
    LOG_INFO() << e.model << " confusion matrix: TN=" << m.true_negatives
               << " FP=" << m.false_positives << " (unnecessary blocks)"
               << " FN=" << m.false_negatives << " (missed fraud, critical)"
               << " TP=" << m.true_positives;
    if (m.false_negatives > 0) {
        LOG_WARNING() << e.model << " missed " << m.false_negatives << " fraudulent transactions";
    }
    LOG_INFO() << e.model << " classification report:\n" << FormatClassificationReport(m);
}

} // namespace fraud_fusion::training
