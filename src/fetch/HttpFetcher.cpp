#include "fetch/HttpFetcher.hpp"
#include "runtime/Context.hpp"
#include "util/curlWrappers.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <cstdlib>
#include <system_error>
#include <boost/algorithm/string/replace.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace cw::fetch;
using namespace cw::util;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

std::string extensionOf(const std::string& url) {
    auto path = url.substr(0, url.find_first_of("?#"));
    const auto slash = path.rfind('/');
    if (slash != std::string::npos) path = path.substr(slash + 1);
    const auto dot = path.rfind('.');
    if (dot == std::string::npos || path.size() - dot > 5) return ".jpg";
    return path.substr(dot);
}

std::string stringOr(const json& j, const char* key) {
    if (!j.is_object()) return {};
    const auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

}

HttpFetcher::HttpFetcher(const std::shared_ptr<runtime::Context>& ctx)
    : cfg_(ctx->config.content.fetcher),
      descriptionFile_(ctx->config.content.description_file),
      log_(ctx->logs->fetch()) {
    try {
        idRe_ = std::regex(cfg_.id_pattern);
    } catch (const std::regex_error& e) {
        throw config::ConfigError(fmt::format("content.fetcher.id_pattern is not a valid expression: {}", e.what()));
    }
    ensureCurlGlobalInit();
}

std::optional<std::string> HttpFetcher::deriveId(const std::string& reference) const {
    std::smatch m;
    if (!std::regex_search(reference, m, idRe_)) return std::nullopt;
    auto id = m.size() > 1 ? m[1].str() : m[0].str();
    if (id.empty()) return std::nullopt;
    return id;
}

fs::path HttpFetcher::artifactPath(const fs::path& targetDir) const {
    return targetDir / descriptionFile_;
}

std::string HttpFetcher::fullSizeProfileUrl(const std::string& url) {
    return boost::algorithm::replace_last_copy(url, "_normal", "_400x400");
}

std::string HttpFetcher::metadataUrl(const std::string& id) const {
    return boost::algorithm::replace_all_copy(cfg_.metadata_url, "{id}", id);
}

std::optional<json> HttpFetcher::fetchMetadata(const std::string& id) const {
    SList headers;
    headers.add("Accept: application/json");
    if (!cfg_.bearer_token_env.empty())
        if (const char* token = std::getenv(cfg_.bearer_token_env.c_str()); token && *token)
            headers.add(fmt::format("Authorization: Bearer {}", token));

    const auto url = metadataUrl(id);
    const auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (!r.httpOk()) {
        log_->error("[HttpFetcher] Metadata request for {} failed: CURL={} HTTP={} ({})",
                    id, static_cast<int>(r.curl), r.code, r.error);
        return std::nullopt;
    }

    auto meta = json::parse(r.body, nullptr, false);
    if (meta.is_discarded() || !meta.is_object()) {
        log_->error("[HttpFetcher] Metadata for {} is not a JSON object", id);
        return std::nullopt;
    }

    return meta;
}

std::optional<fs::path> HttpFetcher::download(const std::string& url, const fs::path& targetDir,
                                              const std::string& stem) const {
    const auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (!r.httpOk() || r.body.empty()) {
        log_->warn("[HttpFetcher] Download of {} failed: CURL={} HTTP={} ({})",
                   url, static_cast<int>(r.curl), r.code, r.error);
        return std::nullopt;
    }

    const auto out = targetDir / (stem + extensionOf(url));
    try {
        atomicWrite(out, r.body);
    } catch (const std::exception& e) {
        log_->error("[HttpFetcher] Failed to store {}: {}", out.string(), e.what());
        return std::nullopt;
    }

    return out;
}

json HttpFetcher::describe(const std::string& reference, const std::string& id, const json& meta) {
    const auto data = meta.value("data", json::object());

    json author = json::object();
    json photo = json::object();

    if (const auto includes = meta.value("includes", json::object()); includes.is_object()) {
        const auto users = includes.value("users", json::array());
        const auto authorId = stringOr(data, "author_id");
        for (const auto& u : users) {
            if (authorId.empty() || stringOr(u, "id") == authorId) {
                author = u;
                break;
            }
        }

        for (const auto& m : includes.value("media", json::array())) {
            if (stringOr(m, "type") == "photo" && !stringOr(m, "url").empty()) {
                photo = m;
                break;
            }
        }
    }

    return {
        {"reference", reference},
        {"id", id},
        {"text", stringOr(data, "text")},
        {"created_at", stringOr(data, "created_at")},
        {"name", stringOr(author, "name")},
        {"username", stringOr(author, "username")},
        {"profile_image_url", fullSizeProfileUrl(stringOr(author, "profile_image_url"))},
        {"photo_url", stringOr(photo, "url")},
        {"fetched_at", utcIsoTimestamp()}
    };
}

void HttpFetcher::fetch(const std::string& reference, const fs::path& targetDir) {
    const auto id = deriveId(reference);
    if (!id) {
        log_->warn("[HttpFetcher] No identifier in '{}'", reference);
        return;
    }

    std::error_code ec;
    fs::create_directories(targetDir, ec);
    if (ec) {
        log_->error("[HttpFetcher] Failed to create {}: {}", targetDir.string(), ec.message());
        return;
    }

    try {
        const auto meta = fetchMetadata(*id);
        if (!meta) return;

        auto doc = describe(reference, *id, *meta);

        doc["profile_image"] = nullptr;
        if (const auto url = doc["profile_image_url"].get<std::string>(); !url.empty())
            if (const auto path = download(url, targetDir, "profile")) doc["profile_image"] = path->string();

        doc["photo"] = nullptr;
        if (const auto url = doc["photo_url"].get<std::string>(); !url.empty())
            if (const auto path = download(url, targetDir, "photo")) doc["photo"] = path->string();

        // written last: its presence marks the asset as complete
        atomicWrite(artifactPath(targetDir), doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
        log_->info("[HttpFetcher] Stored {} (@{}) in {}", *id, doc["username"].get<std::string>(), targetDir.string());
    } catch (const std::exception& e) {
        log_->error("[HttpFetcher] Fetch of '{}' failed: {}", reference, e.what());
    }
}
