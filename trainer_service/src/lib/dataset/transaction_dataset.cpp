#include "transaction_dataset.hpp"

#include <cstdint>

#include <userver/logging/log.hpp>

#include "csv_reader.hpp"

namespace fraud_fusion::training {

namespace {

int ParseLabel(const CsvReader& reader, std::size_t column) {
    return reader.Int(column) != 0 ? 1 : 0;
}

} // anonymous namespace

std::size_t ReadPaymentDataset(const std::string& path,
                               const std::function<void(PaymentRecord&&)>& sink) {
    CsvReader reader(path);
    const auto step = reader.ColumnIndex("step");
    const auto type = reader.ColumnIndex("type");
    const auto amount = reader.ColumnIndex("amount");
    const auto old_org = reader.ColumnIndex("oldbalanceOrg");
    const auto new_orig = reader.ColumnIndex("newbalanceOrig");
    const auto old_dest = reader.ColumnIndex("oldbalanceDest");
    const auto new_dest = reader.ColumnIndex("newbalanceDest");
    const auto is_fraud = reader.ColumnIndex("isFraud");

    std::size_t rows = 0;
    while (reader.Next()) {
        PaymentRecord record;
        record.txn.set_step(static_cast<int32_t>(reader.Int(step)));
        record.txn.set_type(reader.Field(type));
        record.txn.set_amount(reader.Double(amount));
        record.txn.set_oldbalance_org(reader.Double(old_org));
        record.txn.set_newbalance_orig(reader.Double(new_orig));
        record.txn.set_oldbalance_dest(reader.Double(old_dest));
        record.txn.set_newbalance_dest(reader.Double(new_dest));
        record.is_fraud = ParseLabel(reader, is_fraud);
        sink(std::move(record));
        ++rows;
    }
    LOG_INFO() << "Read " << rows << " payment rows from " << path;
    return rows;
}

std::size_t ReadCardDataset(const std::string& path,
                            const std::function<void(CardRecord&&)>& sink) {
    CsvReader reader(path);
    const auto amt = reader.ColumnIndex("amt");
    const auto lat = reader.ColumnIndex("lat");
    const auto lon = reader.ColumnIndex("long");
    const auto merch_lat = reader.ColumnIndex("merch_lat");
    const auto merch_long = reader.ColumnIndex("merch_long");
    const auto dob = reader.ColumnIndex("dob");
    const auto city_pop = reader.ColumnIndex("city_pop");
    const auto is_fraud = reader.ColumnIndex("is_fraud");

    std::size_t rows = 0;
    while (reader.Next()) {
        CardRecord record;
        record.txn.set_amt(reader.Double(amt));
        record.txn.set_lat(reader.Double(lat));
        record.txn.set_long_(reader.Double(lon));
        record.txn.set_merch_lat(reader.Double(merch_lat));
        record.txn.set_merch_long(reader.Double(merch_long));
        record.txn.set_dob(reader.Field(dob));
        record.txn.set_city_pop(reader.Int(city_pop));
        record.is_fraud = ParseLabel(reader, is_fraud);
        sink(std::move(record));
        ++rows;
    }
    LOG_INFO() << "Read " << rows << " card rows from " << path;
    return rows;
}

} // namespace fraud_fusion::training
