#pragma once

#include <stdexcept>
#include <string>

#include <transaction/transaction.pb.h>

namespace fraud_fusion {

// Malformed body or a field outside its allowed range. Maps to 400.
class InvalidRequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON body of POST /predict/primary. Both proto field names and the PaySim
// spellings (oldbalanceOrg, ...) are accepted. type, amount, oldbalanceOrg and
// newbalanceOrig are required; step defaults to 1, destination balances to 0.
transaction::PaymentTransaction ParsePaymentRequest(const std::string& body);

// JSON body of POST /predict/secondary. Every field is required.
transaction::CardTransaction ParseCardRequest(const std::string& body);

void ValidatePaymentTransaction(const transaction::PaymentTransaction& txn);
void ValidateCardTransaction(const transaction::CardTransaction& txn);

} // namespace fraud_fusion
