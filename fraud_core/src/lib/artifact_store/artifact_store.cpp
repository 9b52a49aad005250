#include "artifact_store.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <userver/logging/log.hpp>

#include "utils/string_utils.hpp"

namespace fraud_fusion {

namespace {

namespace fs = std::filesystem;

std::string_view FileName(ArtifactKey key) {
    switch (key) {
        case ArtifactKey::kChampion:
            return "model_primary.json";
        case ArtifactKey::kBaseline:
            return "model_logistic.pb";
        case ArtifactKey::kAnomalyDetector:
            return "model_isolation_forest.pb";
        case ArtifactKey::kCategoryEncoder:
            return "label_encoder_type.pb";
        case ArtifactKey::kSecondaryForest:
            return "model_secondary_rf.txt";
        case ArtifactKey::kSecondaryAnomalyDetector:
            return "model_secondary_iso.pb";
    }
    throw std::invalid_argument("Unknown ArtifactKey");
}

} // anonymous namespace

std::string_view ToString(ArtifactKey key) {
    switch (key) {
        case ArtifactKey::kChampion:
            return "primary";
        case ArtifactKey::kBaseline:
            return "logistic";
        case ArtifactKey::kAnomalyDetector:
            return "isolation_forest";
        case ArtifactKey::kCategoryEncoder:
            return "encoder";
        case ArtifactKey::kSecondaryForest:
            return "secondary_rf";
        case ArtifactKey::kSecondaryAnomalyDetector:
            return "secondary_isolation_forest";
    }
    throw std::invalid_argument("Unknown ArtifactKey");
}

ArtifactStore::ArtifactStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string ArtifactStore::ModelPath(ArtifactKey key) const {
    return (fs::path(directory_) / FileName(key)).string();
}

std::string ArtifactStore::ColumnsPath(ArtifactKey key) const {
    fs::path path = fs::path(directory_) / FileName(key);
    return (path.parent_path() / (path.stem().string() + "_columns.txt")).string();
}

bool ArtifactStore::Exists(ArtifactKey key) const {
    std::error_code ec;
    return fs::is_regular_file(ModelPath(key), ec);
}

void ArtifactStore::ReplaceFile(const std::string& target,
                                const std::function<void(const std::string&)>& writer) const {
    fs::create_directories(directory_);

    // Keep the extension: model libraries pick the format from it.
    const fs::path target_path(target);
    const fs::path tmp_path = target_path.parent_path() / (".tmp-" + target_path.filename().string());

    try {
        writer(tmp_path.string());
        fs::rename(tmp_path, target_path);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw std::runtime_error("Failed to write artifact " + target + ": " + e.what());
    }
}

void ArtifactStore::Replace(ArtifactKey key,
                            const std::function<void(const std::string&)>& writer) const {
    ReplaceFile(ModelPath(key), writer);
    LOG_INFO() << "Saved " << ToString(key) << " -> " << ModelPath(key);
}

void ArtifactStore::WriteMessage(ArtifactKey key, const google::protobuf::MessageLite& message) const {
    Replace(key, [&message](const std::string& path) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open " + path + " for writing");
        }
        if (!message.SerializeToOstream(&out)) {
            throw std::runtime_error("Failed to serialize " + message.GetTypeName());
        }
        out.close();
        if (out.fail()) {
            throw std::runtime_error("Failed to flush " + path);
        }
    });
}

bool ArtifactStore::ReadMessage(ArtifactKey key, google::protobuf::MessageLite& message) const {
    const std::string path = ModelPath(key);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARNING() << "Cannot open artifact file: " << path;
        return false;
    }
    if (!message.ParseFromIstream(&in)) {
        LOG_ERROR() << "Failed to parse " << message.GetTypeName() << " from " << path;
        return false;
    }
    return true;
}

void ArtifactStore::WriteColumns(ArtifactKey key, const std::vector<std::string_view>& columns) const {
    ReplaceFile(ColumnsPath(key), [&columns](const std::string& path) {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open " + path + " for writing");
        }
        for (const auto& column : columns) {
            out << column << '\n';
        }
        out.close();
        if (out.fail()) {
            throw std::runtime_error("Failed to flush " + path);
        }
    });
}

std::optional<std::vector<std::string>> ArtifactStore::ReadColumns(ArtifactKey key) const {
    const std::string path = ColumnsPath(key);
    std::ifstream columns_file(path);
    if (!columns_file.is_open()) {
        LOG_ERROR() << "Cannot open feature columns file: " << path;
        return std::nullopt;
    }
    std::vector<std::string> columns;
    std::string line;
    while (std::getline(columns_file, line)) {
        line = utils::Trim(line);
        if (!line.empty()) {
            columns.push_back(line);
        }
    }
    return columns;
}

} // namespace fraud_fusion
