#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fraud_fusion::training {

inline constexpr double kDecisionThreshold = 0.5;

struct ConfusionMatrix {
    int64_t true_negatives = 0;
    int64_t false_positives = 0;
    int64_t false_negatives = 0;
    int64_t true_positives = 0;

    double Precision() const;
    double Recall() const;
    double F1() const;
};

// Area under the precision-recall curve as the step-wise sum
// sum_n (R_n - R_{n-1}) * P_n over distinct score thresholds.
// Returns 0 when `labels` has no positive row.
double AveragePrecision(const std::vector<int>& labels, const std::vector<double>& scores);

// 1 where score > threshold.
std::vector<int> ToPredictions(const std::vector<double>& scores, double threshold = kDecisionThreshold);

ConfusionMatrix ComputeConfusionMatrix(const std::vector<int>& labels, const std::vector<int>& predictions);

double F1Score(const std::vector<int>& labels, const std::vector<int>& predictions);

// Per-class precision, recall, F1 and support as a fixed-width table.
std::string FormatClassificationReport(const ConfusionMatrix& matrix);

} // namespace fraud_fusion::training
