#pragma once

#include "sync/AssetFetcher.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace cw::runtime { struct Context; }

namespace cw::fetch {

// Fetches post metadata over HTTP, downloads the author's profile image and
// the first attached photo, and writes a JSON description file.
class HttpFetcher final : public sync::AssetFetcher {
public:
    explicit HttpFetcher(const std::shared_ptr<runtime::Context>& ctx);

    [[nodiscard]] std::optional<std::string> deriveId(const std::string& reference) const override;
    void fetch(const std::string& reference, const std::filesystem::path& targetDir) override;
    [[nodiscard]] std::filesystem::path artifactPath(const std::filesystem::path& targetDir) const override;

    // "https://pbs.example/a_normal.jpg" -> "https://pbs.example/a_400x400.jpg"
    static std::string fullSizeProfileUrl(const std::string& url);

    // Builds the description document from a metadata response.
    static nlohmann::json describe(const std::string& reference, const std::string& id, const nlohmann::json& meta);

private:
    config::FetcherConfig cfg_;
    std::string descriptionFile_;
    std::regex idRe_;
    std::shared_ptr<spdlog::logger> log_;

    [[nodiscard]] std::string metadataUrl(const std::string& id) const;
    [[nodiscard]] std::optional<nlohmann::json> fetchMetadata(const std::string& id) const;
    [[nodiscard]] std::optional<std::filesystem::path> download(const std::string& url,
                                                                const std::filesystem::path& targetDir,
                                                                const std::string& stem) const;
};

}
