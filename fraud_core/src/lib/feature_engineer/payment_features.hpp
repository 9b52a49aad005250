#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

#include <transaction/transaction.pb.h>

#include "category_encoding/category_encoding.hpp"

namespace fraud_fusion {

// Column order is the contract with every trained payment model.
enum PaymentFeature : std::size_t {
    kType = 0,
    kAmount,
    kOldBalanceOrg,
    kNewBalanceOrig,
    kErrorBalanceOrg,
    kErrorBalanceDest,
    kPaymentFeatureCount
};

inline constexpr std::array<std::string_view, kPaymentFeatureCount> kPaymentFeatureColumns = {
    "type",
    "amount",
    "oldbalanceOrg",
    "newbalanceOrig",
    "errorBalanceOrg",
    "errorBalanceDest",
};

using PaymentFeatureVector = std::array<double, kPaymentFeatureCount>;

// newbalanceOrig + amount - oldbalanceOrg, ~0 for a consistent sender side.
double ErrorBalanceOrg(const transaction::PaymentTransaction& txn);

// oldbalanceDest + amount - newbalanceDest, ~0 for a consistent recipient side.
double ErrorBalanceDest(const transaction::PaymentTransaction& txn);

PaymentFeatureVector ComputePaymentFeatures(
    const transaction::PaymentTransaction& txn,
    const CategoryEncoding& encoding);

std::vector<std::string_view> PaymentFeatureNames();

} // namespace fraud_fusion
