#pragma once

#include <string_view>
#include <vector>

#include "dataset/labeled_matrix.hpp"
#include "ml_model/logistic_model.hpp"
#include "trainer_config/trainer_config.hpp"

namespace fraud_fusion::training {

// L2-regularized logistic regression with balanced class weights, fit by
// Newton steps on standardized features. The intercept is not penalized.
LogisticModel FitLogistic(const LabeledMatrix& data,
                          const LogisticConfig& config,
                          const std::vector<std::string_view>& feature_names);

} // namespace fraud_fusion::training
