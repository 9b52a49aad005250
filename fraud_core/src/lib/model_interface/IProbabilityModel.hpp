#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace fraud_fusion {

// Supervised model returning P(fraud) per row.
class IProbabilityModel {
public:
    virtual ~IProbabilityModel() = default;

    // `rows` is row-major with `num_features` columns.
    virtual std::vector<double> PredictBatch(
        const std::vector<float>& rows, std::size_t num_features) const = 0;

    virtual std::string_view Name() const = 0;

    double PredictProbability(const std::vector<float>& features) const {
        auto out = PredictBatch(features, features.size());
        if (out.size() != 1) {
            throw std::runtime_error("Model returned unexpected number of predictions");
        }
        return out.front();
    }
};

using ProbabilityModelPtr = std::unique_ptr<IProbabilityModel>;

inline float SafeFloat(double v) {
    if (!std::isfinite(v)) return 0.0f;
    const double MAXF = 3.4e37;
    if (v > MAXF) return static_cast<float>(MAXF);
    if (v < -MAXF) return static_cast<float>(-MAXF);
    return static_cast<float>(v);
}

template <std::size_t N>
std::vector<float> ToModelInput(const std::array<double, N>& features) {
    std::vector<float> row(N);
    for (std::size_t i = 0; i < N; ++i) {
        row[i] = SafeFloat(features[i]);
    }
    return row;
}

} // namespace fraud_fusion
