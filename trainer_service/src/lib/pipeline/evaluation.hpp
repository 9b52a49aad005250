#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "metrics/metrics.hpp"

namespace fraud_fusion::training {

struct ModelEvaluation {
    std::string model;
    double auprc = 0.0;
    double f1 = 0.0;
    ConfusionMatrix confusion;
};

// `scores` rank the rows for AUPRC; `predictions` give the hard decision.
ModelEvaluation Evaluate(std::string model,
                         const std::vector<int>& labels,
                         const std::vector<double>& scores,
                         const std::vector<int>& predictions);

void LogEvaluationTable(std::string_view title, const std::vector<ModelEvaluation>& evaluations);

// False negatives are the missed fraud and get called out.
void LogConfusionMatrix(const ModelEvaluation& evaluation);

} // namespace fraud_fusion::training
