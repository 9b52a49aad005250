#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message_lite.h>

namespace fraud_fusion {

enum class ArtifactKey {
    kChampion,
    kBaseline,
    kAnomalyDetector,
    kCategoryEncoder,
    kSecondaryForest,
    kSecondaryAnomalyDetector,
};

inline constexpr std::array<ArtifactKey, 6> kAllArtifactKeys = {
    ArtifactKey::kChampion,
    ArtifactKey::kBaseline,
    ArtifactKey::kAnomalyDetector,
    ArtifactKey::kCategoryEncoder,
    ArtifactKey::kSecondaryForest,
    ArtifactKey::kSecondaryAnomalyDetector,
};

// Stable logical name, independent of the file layout.
std::string_view ToString(ArtifactKey key);

// Directory-backed holder of trained artifacts.
// Every write goes to a temporary file in the same directory and is renamed
// over the previous artifact, so readers see either the old or the new file.
class ArtifactStore {
public:
    explicit ArtifactStore(std::string directory);

    const std::string& Directory() const { return directory_; }

    std::string ModelPath(ArtifactKey key) const;

    // Feature columns the model at `key` was trained on, one per line.
    std::string ColumnsPath(ArtifactKey key) const;

    bool Exists(ArtifactKey key) const;

    // `writer` must create the file at the path it is given.
    void Replace(ArtifactKey key, const std::function<void(const std::string&)>& writer) const;

    void WriteMessage(ArtifactKey key, const google::protobuf::MessageLite& message) const;
    bool ReadMessage(ArtifactKey key, google::protobuf::MessageLite& message) const;

    void WriteColumns(ArtifactKey key, const std::vector<std::string_view>& columns) const;
    std::optional<std::vector<std::string>> ReadColumns(ArtifactKey key) const;

private:
    void ReplaceFile(const std::string& target,
                     const std::function<void(const std::string&)>& writer) const;

    std::string directory_;
};

} // namespace fraud_fusion
