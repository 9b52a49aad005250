#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <models/artifacts.pb.h>

namespace fraud_fusion {

inline constexpr int kDefaultCategoryCode = 0;

// Label -> code mapping for the transaction type column.
// Codes follow lexicographic order of the labels seen during training and
// never change for the lifetime of a model artifact.
class CategoryEncoding {
public:
    CategoryEncoding() = default;

    // Sorts and deduplicates `labels`.
    static CategoryEncoding Fit(std::vector<std::string> labels);

    static CategoryEncoding FromProto(const models::CategoryEncoding& proto);
    models::CategoryEncoding ToProto() const;

    std::optional<int> Find(std::string_view label) const;

    // Unseen labels map to kDefaultCategoryCode.
    int EncodeOrDefault(std::string_view label) const;

    const std::vector<std::string>& Classes() const { return classes_; }
    bool Empty() const { return classes_.empty(); }

private:
    explicit CategoryEncoding(std::vector<std::string> classes);

    std::vector<std::string> classes_;
};

} // namespace fraud_fusion
