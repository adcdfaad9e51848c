#pragma once

#include "label/Label.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cw::feed {

// Emitted when an entry's content fingerprint differs from the stored one.
struct ChangeRecord {
    std::string entry_name;
    label::StoryInfo info;
    std::string fingerprint;
    std::string timestamp;     // ISO-8601, local time
    std::string watcher_name;
};

void to_json(nlohmann::json& j, const ChangeRecord& c);

}
