#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <transaction/transaction.pb.h>

namespace fraud_fusion {

enum CardFeature : std::size_t {
    kCardAmount = 0,
    kDistanceToMerchant,
    kAge,
    kCityPopulation,
    kCardFeatureCount
};

inline constexpr std::array<std::string_view, kCardFeatureCount> kCardFeatureColumns = {
    "amt",
    "dist_to_merch",
    "age",
    "city_pop",
};

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr int kAgeReferenceYear = 2025;
inline constexpr int kDefaultAge = 30;

using CardFeatureVector = std::array<double, kCardFeatureCount>;

// Great-circle distance in kilometres.
double HaversineKm(double lon1, double lat1, double lon2, double lat2);

// Accepts "YYYY-MM-DD" with an optional time suffix.
std::optional<int> ParseBirthYear(const std::string& dob);

int AgeFromBirthDate(const std::string& dob);

CardFeatureVector ComputeCardFeatures(const transaction::CardTransaction& txn);

std::vector<std::string_view> CardFeatureNames();

} // namespace fraud_fusion
