#include "csv_reader.hpp"

#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include "utils/string_utils.hpp"

namespace fraud_fusion::training {

std::vector<std::string> SplitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(utils::Trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(utils::Trim(current));
    return fields;
}

CsvReader::CsvReader(std::string path)
    : path_(std::move(path))
    , stream_(path_) {
    if (!stream_.is_open()) {
        throw std::runtime_error("Cannot open dataset: " + path_);
    }
    std::string line;
    if (!std::getline(stream_, line)) {
        throw std::runtime_error("Dataset is empty: " + path_);
    }
    ++line_number_;
    header_ = SplitCsvLine(line);
}

bool CsvReader::Next() {
    std::string line;
    while (std::getline(stream_, line)) {
        ++line_number_;
        if (utils::Trim(line).empty()) continue;
        fields_ = SplitCsvLine(line);
        if (fields_.size() != header_.size()) {
            Fail(fmt::format("expected {} fields, got {}", header_.size(), fields_.size()));
        }
        return true;
    }
    return false;
}

std::size_t CsvReader::ColumnIndex(std::string_view name) const {
    for (std::size_t i = 0; i < header_.size(); ++i) {
        if (header_[i] == name) return i;
    }
    throw std::runtime_error(fmt::format("Dataset {} has no column '{}'", path_, name));
}

const std::string& CsvReader::Field(std::size_t index) const {
    return fields_.at(index);
}

double CsvReader::Double(std::size_t index) const {
    const auto& text = Field(index);
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        Fail(fmt::format("'{}' is not a number in column '{}'", text, header_[index]));
    }
    return value;
}

int64_t CsvReader::Int(std::size_t index) const {
    const auto& text = Field(index);
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size()) {
        Fail(fmt::format("'{}' is not an integer in column '{}'", text, header_[index]));
    }
    return static_cast<int64_t>(value);
}

void CsvReader::Fail(const std::string& message) const {
    throw std::runtime_error(fmt::format("{}:{}: {}", path_, line_number_, message));
}

} // namespace fraud_fusion::training
