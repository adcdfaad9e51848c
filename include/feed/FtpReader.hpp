#pragma once

#include "feed/Reader.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <memory>
#include <spdlog/logger.h>

namespace cw::runtime { struct Context; }

namespace cw::feed {

// Reader over the rundown server's FTP interface. One curl handle is kept for
// the lifetime of the session so the control connection is reused.
class FtpReader final : public Reader {
public:
    explicit FtpReader(const std::shared_ptr<runtime::Context>& ctx);
    ~FtpReader() override;

    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override { return connected_; }

    bool navigateTo(const std::string& path) override;
    std::vector<Entry> listEntries(const std::string& path) override;
    std::optional<std::string> readEntry(const std::string& name) override;
    [[nodiscard]] std::string currentFolder() const override { return cwd_; }

    // "/A\\B//C" -> "A/B/C"
    static std::string normalizePath(const std::string& path);

private:
    config::RemoteConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
    std::unique_ptr<util::CurlEasy> handle_;
    std::string cwd_;
    bool connected_ = false;

    [[nodiscard]] std::string baseUrl() const;
    [[nodiscard]] std::string dirUrl(const std::string& path) const;
    [[nodiscard]] std::string escape(const std::string& segment) const;

    void applySession(CURL* h) const;
    void noteFailure(const util::Response& r, const std::string& what);
};

}
