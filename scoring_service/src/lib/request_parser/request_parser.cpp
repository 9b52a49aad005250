#include "request_parser.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>

#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>
#include <userver/formats/json/exception.hpp>
#include <userver/formats/json/serialize.hpp>
#include <userver/formats/json/value.hpp>

namespace fraud_fusion {

namespace {

// Two spellings JsonStringToMessage accepts for the same field.
struct FieldNames {
    std::string_view json;
    std::string_view alias;
};

constexpr FieldNames kRequiredPaymentFields[] = {
    {"type", "type"},
    {"amount", "amount"},
    {"oldbalanceOrg", "oldbalance_org"},
    {"newbalanceOrig", "newbalance_orig"},
};

constexpr FieldNames kRequiredCardFields[] = {
    {"amt", "amt"},
    {"lat", "lat"},
    {"long", "long"},
    {"merch_lat", "merchLat"},
    {"merch_long", "merchLong"},
    {"dob", "dob"},
    {"city_pop", "cityPop"},
};

bool HasField(const userver::formats::json::Value& doc, const FieldNames& field) {
    return doc.HasMember(field.json) || doc.HasMember(field.alias);
}

// Proto3 reads an absent number as zero, so presence is checked on the raw document.
template <std::size_t N>
userver::formats::json::Value ParseObject(const std::string& body, const FieldNames (&required)[N]) {
    userver::formats::json::Value doc;
    try {
        doc = userver::formats::json::FromString(body);
    } catch (const userver::formats::json::Exception& e) {
        throw InvalidRequestError(fmt::format("Malformed request body: {}", e.what()));
    }
    if (!doc.IsObject()) {
        throw InvalidRequestError("Request body must be a JSON object");
    }
    for (const auto& field : required) {
        if (!HasField(doc, field)) {
            throw InvalidRequestError(fmt::format("{} is required", field.json));
        }
    }
    return doc;
}

template <typename Message>
Message ParseJson(const std::string& body) {
    Message message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
    if (!status.ok()) {
        throw InvalidRequestError("Malformed request body: " + status.ToString());
    }
    return message;
}

void RequireFinite(double value, std::string_view field) {
    if (!std::isfinite(value)) {
        throw InvalidRequestError(fmt::format("{} must be a finite number", field));
    }
}

void RequireNonNegative(double value, std::string_view field) {
    RequireFinite(value, field);
    if (value < 0) {
        throw InvalidRequestError(fmt::format("{} must be >= 0, got {}", field, value));
    }
}

void RequireRange(double value, double lo, double hi, std::string_view field) {
    RequireFinite(value, field);
    if (value < lo || value > hi) {
        throw InvalidRequestError(fmt::format("{} must lie in [{}, {}], got {}", field, lo, hi, value));
    }
}

} // anonymous namespace

void ValidatePaymentTransaction(const transaction::PaymentTransaction& txn) {
    if (txn.step() < 1) {
        throw InvalidRequestError(fmt::format("step must be >= 1, got {}", txn.step()));
    }
    if (txn.type().empty()) {
        throw InvalidRequestError("type is required");
    }
    RequireNonNegative(txn.amount(), "amount");
    RequireNonNegative(txn.oldbalance_org(), "oldbalanceOrg");
    RequireFinite(txn.newbalance_orig(), "newbalanceOrig");
    RequireNonNegative(txn.oldbalance_dest(), "oldbalanceDest");
    RequireNonNegative(txn.newbalance_dest(), "newbalanceDest");
}

void ValidateCardTransaction(const transaction::CardTransaction& txn) {
    RequireNonNegative(txn.amt(), "amt");
    RequireRange(txn.lat(), -90.0, 90.0, "lat");
    RequireRange(txn.long_(), -180.0, 180.0, "long");
    RequireRange(txn.merch_lat(), -90.0, 90.0, "merch_lat");
    RequireRange(txn.merch_long(), -180.0, 180.0, "merch_long");
    if (txn.city_pop() < 0) {
        throw InvalidRequestError(fmt::format("city_pop must be >= 0, got {}", txn.city_pop()));
    }
}

transaction::PaymentTransaction ParsePaymentRequest(const std::string& body) {
    const auto doc = ParseObject(body, kRequiredPaymentFields);
    auto txn = ParseJson<transaction::PaymentTransaction>(body);
    if (!doc.HasMember("step")) {
        txn.set_step(1);
    }
    ValidatePaymentTransaction(txn);
    return txn;
}

transaction::CardTransaction ParseCardRequest(const std::string& body) {
    ParseObject(body, kRequiredCardFields);
    auto txn = ParseJson<transaction::CardTransaction>(body);
    ValidateCardTransaction(txn);
    return txn;
}

} // namespace fraud_fusion
