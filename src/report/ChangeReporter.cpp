#include "report/ChangeReporter.hpp"
#include "runtime/Context.hpp"
#include "util/files.hpp"

#include <boost/algorithm/string/join.hpp>
#include <nlohmann/json.hpp>

using namespace cw::report;

ChangeReporter::ChangeReporter(const std::shared_ptr<runtime::Context>& ctx)
    : log_(ctx->logs->changes()), changesFile_(ctx->config.report.changes_file) {}

void ChangeReporter::report(const feed::ChangeRecord& change) const {
    const auto& info = change.info;

    std::vector<std::string> labels;
    for (const auto& l : info.allowed_labels)
        labels.push_back(l.channel.empty() ? l.kind : "[" + l.channel + "] " + l.kind);

    log_->info("[{}] {} '{}' status={} by={} at={} labels=[{}] refs=[{}]",
               change.watcher_name, change.entry_name, info.title, info.status, info.modify_by,
               change.timestamp, boost::algorithm::join(labels, ", "),
               boost::algorithm::join(info.references, ", "));

    if (changesFile_.empty()) return;

    try {
        const nlohmann::json j = change;
        util::appendLine(changesFile_, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        log_->error("[ChangeReporter] Failed to append to {}: {}", changesFile_.string(), e.what());
    }
}

void ChangeReporter::report(const std::vector<feed::ChangeRecord>& changes) const {
    for (const auto& c : changes) report(c);
}
