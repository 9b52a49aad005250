#include "metrics.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/format.h>

namespace fraud_fusion::training {

namespace {

double SafeRatio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

double Harmonic(double precision, double recall) {
    return SafeRatio(2.0 * precision * recall, precision + recall);
}

void CheckSizes(std::size_t a, std::size_t b) {
    if (a != b) {
        throw std::invalid_argument(fmt::format("Label and score counts differ: {} vs {}", a, b));
    }
}

} // anonymous namespace

double ConfusionMatrix::Precision() const {
    return SafeRatio(static_cast<double>(true_positives),
                     static_cast<double>(true_positives + false_positives));
}

double ConfusionMatrix::Recall() const {
    return SafeRatio(static_cast<double>(true_positives),
                     static_cast<double>(true_positives + false_negatives));
}

double ConfusionMatrix::F1() const {
    return Harmonic(Precision(), Recall());
}

double AveragePrecision(const std::vector<int>& labels, const std::vector<double>& scores) {
    CheckSizes(labels.size(), scores.size());
    const auto positives = std::count(labels.begin(), labels.end(), 1);
    if (positives == 0) {
        return 0.0;
    }

    std::vector<std::size_t> order(labels.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

    double ap = 0.0;
    double previous_recall = 0.0;
    int64_t tp = 0;
    int64_t fp = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (labels[order[i]] == 1) {
            ++tp;
        } else {
            ++fp;
        }
        // Tied scores form one threshold.
        if (i + 1 < order.size() && scores[order[i + 1]] == scores[order[i]]) {
            continue;
        }
        const double recall = static_cast<double>(tp) / static_cast<double>(positives);
        const double precision = static_cast<double>(tp) / static_cast<double>(tp + fp);
        ap += (recall - previous_recall) * precision;
        previous_recall = recall;
    }
    return ap;
}

std::vector<int> ToPredictions(const std::vector<double>& scores, double threshold) {
    std::vector<int> predictions(scores.size());
    std::transform(scores.begin(), scores.end(), predictions.begin(),
                   [threshold](double s) { return s > threshold ? 1 : 0; });
    return predictions;
}

ConfusionMatrix ComputeConfusionMatrix(const std::vector<int>& labels, const std::vector<int>& predictions) {
    CheckSizes(labels.size(), predictions.size());
    ConfusionMatrix m;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const bool actual = labels[i] == 1;
        const bool predicted = predictions[i] == 1;
        if (actual && predicted) {
            ++m.true_positives;
        } else if (actual) {
            ++m.false_negatives;
        } else if (predicted) {
            ++m.false_positives;
        } else {
            ++m.true_negatives;
        }
    }
    return m;
}

double F1Score(const std::vector<int>& labels, const std::vector<int>& predictions) {
    return ComputeConfusionMatrix(labels, predictions).F1();
}

std::string FormatClassificationReport(const ConfusionMatrix& m) {
    const double legit_precision = SafeRatio(static_cast<double>(m.true_negatives),
                                             static_cast<double>(m.true_negatives + m.false_negatives));
    const double legit_recall = SafeRatio(static_cast<double>(m.true_negatives),
                                          static_cast<double>(m.true_negatives + m.false_positives));
    const int64_t legit_support = m.true_negatives + m.false_positives;
    const int64_t fraud_support = m.true_positives + m.false_negatives;

    std::string report = fmt::format("{:>12} {:>10} {:>10} {:>10} {:>10}\n",
                                     "", "precision", "recall", "f1-score", "support");
    report += fmt::format("{:>12} {:>10.4f} {:>10.4f} {:>10.4f} {:>10}\n", "Legit",
                          legit_precision, legit_recall, Harmonic(legit_precision, legit_recall),
                          legit_support);
    report += fmt::format("{:>12} {:>10.4f} {:>10.4f} {:>10.4f} {:>10}\n", "Fraud",
                          m.Precision(), m.Recall(), m.F1(), fraud_support);
    return report;
}

} // namespace fraud_fusion::training
