#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cw::feed {

// One line of a rundown listing. Recreated on every poll.
struct Entry {
    std::string name;
    bool is_dir = false;
    std::string size = "0";
    std::string raw;
};

// Parses a LIST line. Unix style lines ("drwxr-xr-x 1 user group size month day
// time name") keep names with spaces; shorter lines use the last token.
std::optional<Entry> parseListLine(std::string_view line);

}
