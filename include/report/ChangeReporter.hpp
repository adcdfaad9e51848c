#pragma once

#include "feed/ChangeRecord.hpp"

#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/logger.h>

namespace cw::runtime { struct Context; }

namespace cw::report {

// Writes change records to the "changes" logger and, when configured, to a
// JSON-lines file.
class ChangeReporter {
public:
    explicit ChangeReporter(const std::shared_ptr<runtime::Context>& ctx);

    void report(const feed::ChangeRecord& change) const;
    void report(const std::vector<feed::ChangeRecord>& changes) const;

private:
    std::shared_ptr<spdlog::logger> log_;
    std::filesystem::path changesFile_;
};

}
