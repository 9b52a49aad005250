#pragma once

#include <cstddef>
#include <vector>

namespace fraud_fusion::training {

// Row-major float features with a 0/1 label per row. The layout is the one
// the XGBoost and LightGBM dense-matrix constructors take.
class LabeledMatrix {
public:
    explicit LabeledMatrix(std::size_t num_features = 0);

    std::size_t NumFeatures() const { return num_features_; }
    std::size_t Rows() const { return labels_.size(); }
    bool Empty() const { return labels_.empty(); }

    const std::vector<float>& Values() const { return values_; }
    const std::vector<int>& Labels() const { return labels_; }

    const float* Row(std::size_t index) const { return values_.data() + index * num_features_; }
    int Label(std::size_t index) const { return labels_[index]; }

    void Reserve(std::size_t rows);
    void AppendRow(const float* row, int label);
    void AppendRow(const std::vector<float>& row, int label);

    std::size_t CountLabel(int label) const;

    LabeledMatrix Select(const std::vector<std::size_t>& indices) const;

    // Feature rows of one class, labels dropped.
    std::vector<float> RowsWithLabel(int label) const;

private:
    std::size_t num_features_;
    std::vector<float> values_;
    std::vector<int> labels_;
};

} // namespace fraud_fusion::training
