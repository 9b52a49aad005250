#include "row_sampler.hpp"

namespace fraud_fusion::training {

ClassAwareSampler::ClassAwareSampler(double legit_fraction, uint64_t seed)
    : legit_fraction_(legit_fraction), rng_(seed) {
    if (!(legit_fraction_ > 0.0 && legit_fraction_ <= 1.0)) {
        throw std::invalid_argument("Sample fraction must lie in (0, 1]");
    }
}

bool ClassAwareSampler::Keep(int label) {
    ++seen_;
    if (label == 1) {
        ++kept_fraud_;
        return true;
    }
    // Full fraction keeps every row without touching the generator.
    if (legit_fraction_ >= 1.0 || uniform_(rng_) < legit_fraction_) {
        ++kept_legit_;
        return true;
    }
    return false;
}

} // namespace fraud_fusion::training
