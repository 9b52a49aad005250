#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fraud_fusion {

// Invalid or incomplete setup detected before any work starts.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A model or encoder required by a request path is not loaded.
class ArtifactMissingError : public std::runtime_error {
public:
    explicit ArtifactMissingError(std::string key)
        : std::runtime_error("Artifact not loaded: " + key)
        , key_(std::move(key)) {}

    const std::string& Key() const noexcept { return key_; }

private:
    std::string key_;
};

} // namespace fraud_fusion
