#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace fraud_fusion::training {

// Keeps every fraud row and each legitimate row with probability `legit_fraction`.
class ClassAwareSampler {
public:
    ClassAwareSampler(double legit_fraction, uint64_t seed);

    bool Keep(int label);

    std::size_t KeptFraud() const { return kept_fraud_; }
    std::size_t KeptLegit() const { return kept_legit_; }
    std::size_t Seen() const { return seen_; }

private:
    double legit_fraction_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
    std::size_t kept_fraud_ = 0;
    std::size_t kept_legit_ = 0;
    std::size_t seen_ = 0;
};

// Uniform fixed-size sample of a stream of unknown length (algorithm R).
template <typename T>
class ReservoirSampler {
public:
    ReservoirSampler(std::size_t capacity, uint64_t seed)
        : capacity_(capacity), rng_(seed) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Reservoir capacity must be positive");
        }
        items_.reserve(capacity_);
    }

    void Offer(T&& item) {
        ++seen_;
        if (items_.size() < capacity_) {
            items_.push_back(std::move(item));
            return;
        }
        std::uniform_int_distribution<std::size_t> pick(0, seen_ - 1);
        const auto slot = pick(rng_);
        if (slot < capacity_) {
            items_[slot] = std::move(item);
        }
    }

    std::size_t Seen() const { return seen_; }

    std::vector<T> Release() { return std::move(items_); }

private:
    std::size_t capacity_;
    std::mt19937_64 rng_;
    std::vector<T> items_;
    std::size_t seen_ = 0;
};

} // namespace fraud_fusion::training
