#pragma once

#include <cstdint>

#include "dataset/labeled_matrix.hpp"

namespace fraud_fusion::training {

// Synthetic Minority Over-sampling. New minority rows are interpolated between
// a minority row and one of its k nearest minority neighbours (Euclidean)
// until both classes have the same count. The input rows come first in the
// output, synthetic rows after them.
// Throws std::invalid_argument when the minority class has fewer than two rows.
LabeledMatrix Smote(const LabeledMatrix& data, int k_neighbors, uint64_t seed);

} // namespace fraud_fusion::training
