#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fraud_fusion::training {

// Splits one CSV record. Double-quoted fields may contain commas and "" escapes.
std::vector<std::string> SplitCsvLine(const std::string& line);

// Streaming reader over a headed CSV file. Parse failures throw
// std::runtime_error naming the file and line.
class CsvReader {
public:
    explicit CsvReader(std::string path);

    // Advances to the next non-empty record, false at end of file.
    bool Next();

    std::size_t ColumnIndex(std::string_view name) const;

    const std::string& Field(std::size_t index) const;
    double Double(std::size_t index) const;
    int64_t Int(std::size_t index) const;

    std::size_t LineNumber() const { return line_number_; }
    const std::string& Path() const { return path_; }

private:
    [[noreturn]] void Fail(const std::string& message) const;

    std::string path_;
    std::ifstream stream_;
    std::vector<std::string> header_;
    std::vector<std::string> fields_;
    std::size_t line_number_ = 0;
};

} // namespace fraud_fusion::training
