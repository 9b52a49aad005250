#include "payment_features.hpp"

namespace fraud_fusion {

double ErrorBalanceOrg(const transaction::PaymentTransaction& txn) {
    return txn.newbalance_orig() + txn.amount() - txn.oldbalance_org();
}

double ErrorBalanceDest(const transaction::PaymentTransaction& txn) {
    return txn.oldbalance_dest() + txn.amount() - txn.newbalance_dest();
}

PaymentFeatureVector ComputePaymentFeatures(
    const transaction::PaymentTransaction& txn,
    const CategoryEncoding& encoding) {

    PaymentFeatureVector features{};
    features[kType] = static_cast<double>(encoding.EncodeOrDefault(txn.type()));
    features[kAmount] = txn.amount();
    features[kOldBalanceOrg] = txn.oldbalance_org();
    features[kNewBalanceOrig] = txn.newbalance_orig();
    features[kErrorBalanceOrg] = ErrorBalanceOrg(txn);
    features[kErrorBalanceDest] = ErrorBalanceDest(txn);
    return features;
}

std::vector<std::string_view> PaymentFeatureNames() {
    return {kPaymentFeatureColumns.begin(), kPaymentFeatureColumns.end()};
}

} // namespace fraud_fusion
