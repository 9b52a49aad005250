#include "card_features.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <userver/logging/log.hpp>

#include "utils/string_utils.hpp"

namespace fraud_fusion {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

} // anonymous namespace

double HaversineKm(double lon1, double lat1, double lon2, double lat2) {
    lon1 = ToRadians(lon1);
    lat1 = ToRadians(lat1);
    lon2 = ToRadians(lon2);
    lat2 = ToRadians(lat2);

    const double dlon = lon2 - lon1;
    const double dlat = lat2 - lat1;
    const double a = std::pow(std::sin(dlat / 2), 2) +
                     std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(dlon / 2), 2);
    return kEarthRadiusKm * 2 * std::asin(std::sqrt(a));
}

std::optional<int> ParseBirthYear(const std::string& dob) {
    std::istringstream ss(utils::Trim(dob));
    std::tm tm{};
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        return std::nullopt;
    }
    // Optional time of day, then nothing else.
    if (ss.peek() == ' ' || ss.peek() == 'T') {
        ss.get();
        ss >> std::get_time(&tm, "%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
    }
    if (ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return tm.tm_year + 1900;
}

int AgeFromBirthDate(const std::string& dob) {
    if (auto year = ParseBirthYear(dob)) {
        return kAgeReferenceYear - *year;
    }
    LOG_DEBUG() << "Unparsable date of birth '" << dob << "', using default age " << kDefaultAge;
    return kDefaultAge;
}

CardFeatureVector ComputeCardFeatures(const transaction::CardTransaction& txn) {
    CardFeatureVector features{};
    features[kCardAmount] = txn.amt();
    features[kDistanceToMerchant] =
        HaversineKm(txn.long_(), txn.lat(), txn.merch_long(), txn.merch_lat());
    features[kAge] = static_cast<double>(AgeFromBirthDate(txn.dob()));
    features[kCityPopulation] = static_cast<double>(txn.city_pop());
    return features;
}

std::vector<std::string_view> CardFeatureNames() {
    return {kCardFeatureColumns.begin(), kCardFeatureColumns.end()};
}

} // namespace fraud_fusion
