#include "feed/ChangeRecord.hpp"

#include <nlohmann/json.hpp>

void cw::feed::to_json(nlohmann::json& j, const ChangeRecord& c) {
    j = {
        {"watcher", c.watcher_name},
        {"entry", c.entry_name},
        {"timestamp", c.timestamp},
        {"fingerprint", c.fingerprint},
        {"info", c.info}
    };
}
