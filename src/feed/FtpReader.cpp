#include "feed/FtpReader.hpp"
#include "runtime/Context.hpp"

#include <fmt/format.h>
#include <boost/algorithm/string.hpp>

#include <sstream>
#include <vector>

using namespace cw::feed;
using namespace cw::util;

namespace {

bool isSessionError(const CURLcode code) {
    switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_LOGIN_DENIED:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_WEIRD_SERVER_REPLY:
    case CURLE_FTP_ACCEPT_FAILED:
    case CURLE_FTP_ACCEPT_TIMEOUT:
        return true;
    default:
        return false;
    }
}

std::vector<std::string> splitLines(const std::string& body) {
    std::vector<std::string> lines;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

}

FtpReader::FtpReader(const std::shared_ptr<runtime::Context>& ctx)
    : cfg_(ctx->config.remote), log_(ctx->logs->feed()) {
    ensureCurlGlobalInit();
}

FtpReader::~FtpReader() { disconnect(); }

std::string FtpReader::normalizePath(const std::string& path) {
    auto p = boost::algorithm::replace_all_copy(path, "\\", "/");

    std::vector<std::string> segments, kept;
    boost::algorithm::split(segments, p, boost::algorithm::is_any_of("/"));
    for (auto& s : segments)
        if (!s.empty()) kept.push_back(std::move(s));

    return boost::algorithm::join(kept, "/");
}

std::string FtpReader::escape(const std::string& segment) const {
    char* escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed for: " + segment);
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string FtpReader::baseUrl() const {
    return fmt::format("ftp://{}:{}", cfg_.host, cfg_.port);
}

std::string FtpReader::dirUrl(const std::string& path) const {
    std::string url = baseUrl() + "/";
    if (path.empty()) return url;

    std::vector<std::string> segments;
    boost::algorithm::split(segments, path, boost::algorithm::is_any_of("/"));
    for (const auto& s : segments) url += escape(s) + "/";
    return url;
}

void FtpReader::applySession(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_USERNAME, cfg_.user.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_FTP_RESPONSE_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_MULTICWD));
}

void FtpReader::noteFailure(const Response& r, const std::string& what) {
    log_->error("[FtpReader] {} failed: CURL={} FTP={} ({})", what, static_cast<int>(r.curl), r.code, r.error);
    if (isSessionError(r.curl) && connected_) {
        connected_ = false;
        noteSessionLost();
    }
}

bool FtpReader::connect() {
    log_->info("[FtpReader] Connecting to {}...", cfg_.host);

    try {
        if (!handle_) handle_ = std::make_unique<CurlEasy>();

        const auto password = cfg_.resolvePassword();

        // '*' prefix: a server without SITE CHARSET support must not fail the login
        SList quote;
        if (!cfg_.charset.empty()) quote.add("*SITE CHARSET " + cfg_.charset);

        const auto url = baseUrl() + "/";
        const auto r = performCurl(*handle_, [&](CURL* h) {
            applySession(h);
            curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
            if (quote.get()) curl_easy_setopt(h, CURLOPT_QUOTE, quote.get());
        });

        if (!r.ok()) {
            noteFailure(r, "connect");
            connected_ = false;
            return false;
        }
    } catch (const std::exception& e) {
        log_->error("[FtpReader] Connection error: {}", e.what());
        connected_ = false;
        return false;
    }

    cwd_.clear();
    connected_ = true;
    log_->info("[FtpReader] Connected to {}", cfg_.host);
    return true;
}

void FtpReader::disconnect() {
    if (!handle_) return;
    handle_.reset();  // curl sends QUIT when the cached connection is closed
    connected_ = false;
    cwd_.clear();
    log_->debug("[FtpReader] Disconnected from {}", cfg_.host);
}

bool FtpReader::navigateTo(const std::string& path) {
    if (!ensureConnected()) return false;

    const auto target = normalizePath(path);
    const auto password = cfg_.resolvePassword();

    try {
        const auto url = dirUrl(target);
        const auto r = performCurl(*handle_, [&](CURL* h) {
            applySession(h);
            curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        });

        if (!r.ok()) {
            noteFailure(r, fmt::format("navigate to '{}'", path));
            return false;
        }
    } catch (const std::exception& e) {
        log_->error("[FtpReader] Error navigating to '{}': {}", path, e.what());
        return false;
    }

    cwd_ = target;
    log_->debug("[FtpReader] Navigated to: /{}", cwd_);
    return true;
}

std::vector<Entry> FtpReader::listEntries(const std::string& path) {
    if (!ensureConnected()) return {};
    if (!path.empty() && normalizePath(path) != cwd_ && !navigateTo(path)) return {};

    const auto password = cfg_.resolvePassword();

    Response r;
    try {
        const auto url = dirUrl(cwd_);
        r = performCurl(*handle_, [&](CURL* h) {
            applySession(h);
            curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_DIRLISTONLY, 0L);
        });
    } catch (const std::exception& e) {
        log_->error("[FtpReader] Error listing '/{}': {}", cwd_, e.what());
        return {};
    }

    if (!r.ok()) {
        noteFailure(r, fmt::format("list '/{}'", cwd_));
        return {};
    }

    std::vector<Entry> entries;
    for (const auto& line : splitLines(r.body))
        if (auto entry = parseListLine(line)) entries.push_back(std::move(*entry));

    log_->debug("[FtpReader] Listed {} entries in '/{}'", entries.size(), cwd_);
    return entries;
}

std::optional<std::string> FtpReader::readEntry(const std::string& name) {
    if (!ensureConnected()) return std::nullopt;

    const auto password = cfg_.resolvePassword();

    Response r;
    try {
        const auto url = dirUrl(cwd_) + escape(name);
        r = performCurl(*handle_, [&](CURL* h) {
            applySession(h);
            curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_TRANSFERTEXT, 1L);
        });
    } catch (const std::exception& e) {
        log_->error("[FtpReader] Error reading '{}': {}", name, e.what());
        return std::nullopt;
    }

    if (!r.ok()) {
        noteFailure(r, fmt::format("read '{}'", name));
        return std::nullopt;
    }

    return boost::algorithm::join(splitLines(r.body), "\n");
}
