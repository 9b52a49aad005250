#include "category_encoding.hpp"

#include <algorithm>
#include <stdexcept>

#include <userver/logging/log.hpp>

namespace fraud_fusion {

CategoryEncoding::CategoryEncoding(std::vector<std::string> classes)
    : classes_(std::move(classes)) {}

CategoryEncoding CategoryEncoding::Fit(std::vector<std::string> labels) {
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return CategoryEncoding(std::move(labels));
}

CategoryEncoding CategoryEncoding::FromProto(const models::CategoryEncoding& proto) {
    std::vector<std::string> classes(proto.classes().begin(), proto.classes().end());
    if (!std::is_sorted(classes.begin(), classes.end())) {
        throw std::invalid_argument("CategoryEncoding classes must be stored sorted");
    }
    return CategoryEncoding(std::move(classes));
}

models::CategoryEncoding CategoryEncoding::ToProto() const {
    models::CategoryEncoding proto;
    for (const auto& label : classes_) {
        proto.add_classes(label);
    }
    proto.set_default_code(kDefaultCategoryCode);
    return proto;
}

std::optional<int> CategoryEncoding::Find(std::string_view label) const {
    auto it = std::lower_bound(classes_.begin(), classes_.end(), label,
        [](const std::string& lhs, std::string_view rhs) { return lhs < rhs; });
    if (it == classes_.end() || *it != label) {
        return std::nullopt;
    }
    return static_cast<int>(it - classes_.begin());
}

int CategoryEncoding::EncodeOrDefault(std::string_view label) const {
    if (auto code = Find(label)) {
        return *code;
    }
    LOG_DEBUG() << "Unknown transaction type '" << label
                << "', using default code " << kDefaultCategoryCode;
    return kDefaultCategoryCode;
}

} // namespace fraud_fusion
