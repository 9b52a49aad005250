#include "logistic_model.hpp"

#include <cmath>
#include <stdexcept>

namespace fraud_fusion {

double Sigmoid(double z) {
    if (z >= 0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

LogisticModel::LogisticModel(models::LogisticModel proto)
    : proto_(std::move(proto))
    , feature_names_(proto_.feature_names().begin(), proto_.feature_names().end()) {}

LogisticModel LogisticModel::FromProto(const models::LogisticModel& proto) {
    const int n = proto.feature_names_size();
    if (n == 0 || proto.means_size() != n || proto.scales_size() != n || proto.weights_size() != n) {
        throw std::invalid_argument("LogisticModel artifact has inconsistent dimensions");
    }
    for (double scale : proto.scales()) {
        if (!(scale > 0.0)) {
            throw std::invalid_argument("LogisticModel artifact has a non-positive scale");
        }
    }
    return LogisticModel(proto);
}

double LogisticModel::DecisionFunction(const float* row) const {
    double z = proto_.intercept();
    for (int i = 0; i < proto_.weights_size(); ++i) {
        const double standardized = (static_cast<double>(row[i]) - proto_.means(i)) / proto_.scales(i);
        z += proto_.weights(i) * standardized;
    }
    return z;
}

std::vector<double> LogisticModel::PredictBatch(
    const std::vector<float>& rows, std::size_t num_features) const {

    if (num_features != feature_names_.size() || rows.size() % num_features != 0) {
        throw std::invalid_argument("Feature matrix does not match the logistic model layout");
    }
    const std::size_t num_rows = rows.size() / num_features;
    std::vector<double> probabilities(num_rows);
    for (std::size_t r = 0; r < num_rows; ++r) {
        probabilities[r] = Sigmoid(DecisionFunction(rows.data() + r * num_features));
    }
    return probabilities;
}

} // namespace fraud_fusion
