#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include <transaction/transaction.pb.h>

namespace fraud_fusion::training {

struct PaymentRecord {
    transaction::PaymentTransaction txn;
    int is_fraud = 0;
};

struct CardRecord {
    transaction::CardTransaction txn;
    int is_fraud = 0;
};

// Stream every row of a PaySim CSV (step,type,amount,...,isFraud) into `sink`.
// Returns the number of rows read.
std::size_t ReadPaymentDataset(const std::string& path,
                               const std::function<void(PaymentRecord&&)>& sink);

// Stream every row of a card transactions CSV (amt,lat,long,...,is_fraud).
std::size_t ReadCardDataset(const std::string& path,
                            const std::function<void(CardRecord&&)>& sink);

} // namespace fraud_fusion::training
