#include <userver/utest/utest.hpp>

#include "category_encoding/category_encoding.hpp"
#include "feature_engineer/card_features.hpp"
#include "feature_engineer/payment_features.hpp"

namespace fraud_fusion {

namespace {

transaction::PaymentTransaction MakePayment(const std::string& type, double amount, double old_org,
                                            double new_orig, double old_dest, double new_dest) {
    transaction::PaymentTransaction txn;
    txn.set_step(1);
    txn.set_type(type);
    txn.set_amount(amount);
    txn.set_oldbalance_org(old_org);
    txn.set_newbalance_orig(new_orig);
    txn.set_oldbalance_dest(old_dest);
    txn.set_newbalance_dest(new_dest);
    return txn;
}

} // anonymous namespace

TEST(PaymentFeatures, ColumnOrderIsFixed) {
    const auto names = PaymentFeatureNames();
    const std::vector<std::string_view> expected = {
        "type", "amount", "oldbalanceOrg", "newbalanceOrig", "errorBalanceOrg", "errorBalanceDest"};
    EXPECT_EQ(names, expected);
}

TEST(PaymentFeatures, ComputesBalanceErrors) {
    const auto encoding = CategoryEncoding::Fit({"TRANSFER", "CASH_OUT"});
    const auto txn = MakePayment("TRANSFER", 1000.0, 5000.0, 3500.0, 200.0, 1000.0);

    const auto f = ComputePaymentFeatures(txn, encoding);
    EXPECT_DOUBLE_EQ(f[kType], 1.0);
    EXPECT_DOUBLE_EQ(f[kAmount], 1000.0);
    EXPECT_DOUBLE_EQ(f[kOldBalanceOrg], 5000.0);
    EXPECT_DOUBLE_EQ(f[kNewBalanceOrig], 3500.0);
    EXPECT_DOUBLE_EQ(f[kErrorBalanceOrg], 3500.0 + 1000.0 - 5000.0);
    EXPECT_DOUBLE_EQ(f[kErrorBalanceDest], 200.0 + 1000.0 - 1000.0);
}

TEST(PaymentFeatures, OrderDoesNotDependOnFieldAssignmentOrder) {
    const auto encoding = CategoryEncoding::Fit({"CASH_OUT", "TRANSFER"});
    const auto a = MakePayment("CASH_OUT", 10.0, 20.0, 10.0, 0.0, 10.0);

    transaction::PaymentTransaction b;
    b.set_newbalance_dest(10.0);
    b.set_oldbalance_dest(0.0);
    b.set_newbalance_orig(10.0);
    b.set_oldbalance_org(20.0);
    b.set_amount(10.0);
    b.set_type("CASH_OUT");
    b.set_step(1);

    EXPECT_EQ(ComputePaymentFeatures(a, encoding), ComputePaymentFeatures(b, encoding));
}

TEST(PaymentFeatures, UnknownTypeUsesDefaultCode) {
    const auto encoding = CategoryEncoding::Fit({"CASH_OUT", "TRANSFER"});
    const auto txn = MakePayment("PAYMENT", 10.0, 20.0, 10.0, 0.0, 10.0);

    const auto first = ComputePaymentFeatures(txn, encoding);
    const auto second = ComputePaymentFeatures(txn, encoding);
    EXPECT_DOUBLE_EQ(first[kType], kDefaultCategoryCode);
    EXPECT_EQ(first, second);
}

TEST(CardFeatures, HaversineOneDegreeOfLatitude) {
    EXPECT_NEAR(HaversineKm(0.0, 0.0, 0.0, 1.0), 111.19492664, 1e-6);
    EXPECT_DOUBLE_EQ(HaversineKm(-73.9, 40.7, -73.9, 40.7), 0.0);
}

TEST(CardFeatures, ParsesBirthYear) {
    EXPECT_EQ(ParseBirthYear("1988-03-09").value_or(-1), 1988);
    EXPECT_EQ(ParseBirthYear(" 1975-12-31 00:00:00").value_or(-1), 1975);
    EXPECT_FALSE(ParseBirthYear("").has_value());
    EXPECT_FALSE(ParseBirthYear("not-a-date").has_value());
    EXPECT_FALSE(ParseBirthYear("09/03/1988").has_value());
    EXPECT_EQ(ParseBirthYear("1988-03-09T12:30:00").value_or(-1), 1988);
    EXPECT_FALSE(ParseBirthYear("1988-03-09garbage").has_value());
    EXPECT_FALSE(ParseBirthYear("1988-03-09 noon").has_value());
    EXPECT_FALSE(ParseBirthYear("1988-03-09 00:00:00 extra").has_value());
}

TEST(CardFeatures, ComputesVectorWithAgeFallback) {
    transaction::CardTransaction txn;
    txn.set_amt(42.5);
    txn.set_lat(0.0);
    txn.set_long_(0.0);
    txn.set_merch_lat(1.0);
    txn.set_merch_long(0.0);
    txn.set_dob("garbage");
    txn.set_city_pop(1200);

    const auto f = ComputeCardFeatures(txn);
    EXPECT_DOUBLE_EQ(f[kCardAmount], 42.5);
    EXPECT_NEAR(f[kDistanceToMerchant], 111.19492664, 1e-6);
    EXPECT_DOUBLE_EQ(f[kAge], kDefaultAge);
    EXPECT_DOUBLE_EQ(f[kCityPopulation], 1200.0);

    txn.set_dob("1990-06-15");
    EXPECT_DOUBLE_EQ(ComputeCardFeatures(txn)[kAge], 35.0);
}

} // namespace fraud_fusion
