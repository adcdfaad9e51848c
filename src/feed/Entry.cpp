#include "feed/Entry.hpp"

#include <vector>
#include <boost/algorithm/string.hpp>

using namespace cw::feed;

std::optional<Entry> cw::feed::parseListLine(const std::string_view line) {
    std::vector<std::string> parts;
    const auto trimmed = boost::algorithm::trim_copy(std::string(line));
    if (trimmed.empty()) return std::nullopt;
    boost::algorithm::split(parts, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    Entry entry;
    entry.raw = std::string(line);

    if (parts.size() < 9) {
        entry.name = parts.back();
        entry.is_dir = !line.empty() && line.front() == 'd';
        return entry;
    }

    entry.is_dir = !parts[0].empty() && parts[0].front() == 'd';
    entry.size = parts[4];

    // names may contain spaces: everything from the ninth column on
    std::vector<std::string> nameParts(parts.begin() + 8, parts.end());
    entry.name = boost::algorithm::join(nameParts, " ");
    return entry;
}
