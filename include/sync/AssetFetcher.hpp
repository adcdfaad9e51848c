#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cw::sync {

// Materializes the asset behind a reference into a local directory.
class AssetFetcher {
public:
    virtual ~AssetFetcher() = default;

    // Stable local identifier for a reference, or nullopt when it cannot be derived.
    [[nodiscard]] virtual std::optional<std::string> deriveId(const std::string& reference) const = 0;

    // Creates targetDir and fills it. Implementations contain their own errors.
    virtual void fetch(const std::string& reference, const std::filesystem::path& targetDir) = 0;

    // File whose presence marks a usable asset inside targetDir.
    [[nodiscard]] virtual std::filesystem::path artifactPath(const std::filesystem::path& targetDir) const = 0;
};

}
