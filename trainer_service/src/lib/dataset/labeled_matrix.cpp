#include "labeled_matrix.hpp"

#include <algorithm>
#include <stdexcept>

namespace fraud_fusion::training {

LabeledMatrix::LabeledMatrix(std::size_t num_features)
    : num_features_(num_features) {}

void LabeledMatrix::Reserve(std::size_t rows) {
    values_.reserve(rows * num_features_);
    labels_.reserve(rows);
}

void LabeledMatrix::AppendRow(const float* row, int label) {
    values_.insert(values_.end(), row, row + num_features_);
    labels_.push_back(label);
}

void LabeledMatrix::AppendRow(const std::vector<float>& row, int label) {
    if (row.size() != num_features_) {
        throw std::invalid_argument("Row width does not match the matrix");
    }
    AppendRow(row.data(), label);
}

std::size_t LabeledMatrix::CountLabel(int label) const {
    return static_cast<std::size_t>(std::count(labels_.begin(), labels_.end(), label));
}

LabeledMatrix LabeledMatrix::Select(const std::vector<std::size_t>& indices) const {
    LabeledMatrix out(num_features_);
    out.Reserve(indices.size());
    for (auto index : indices) {
        out.AppendRow(Row(index), labels_.at(index));
    }
    return out;
}

std::vector<float> LabeledMatrix::RowsWithLabel(int label) const {
    std::vector<float> out;
    for (std::size_t i = 0; i < Rows(); ++i) {
        if (labels_[i] == label) {
            out.insert(out.end(), Row(i), Row(i) + num_features_);
        }
    }
    return out;
}

} // namespace fraud_fusion::training
