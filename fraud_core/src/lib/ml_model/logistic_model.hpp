#pragma once

#include <string>
#include <vector>

#include <models/artifacts.pb.h>

#include "model_interface/IProbabilityModel.hpp"

namespace fraud_fusion {

// Baseline linear model. Standardization is part of the artifact so the
// caller passes raw feature values.
class LogisticModel final : public IProbabilityModel {
public:
    static LogisticModel FromProto(const models::LogisticModel& proto);

    const models::LogisticModel& Proto() const { return proto_; }

    const std::vector<std::string>& FeatureNames() const { return feature_names_; }

    // Linear score before the sigmoid.
    double DecisionFunction(const float* row) const;

    std::vector<double> PredictBatch(
        const std::vector<float>& rows, std::size_t num_features) const override;

    std::string_view Name() const override { return "Logistic Regression"; }

private:
    explicit LogisticModel(models::LogisticModel proto);

    models::LogisticModel proto_;
    std::vector<std::string> feature_names_;
};

double Sigmoid(double z);

} // namespace fraud_fusion
