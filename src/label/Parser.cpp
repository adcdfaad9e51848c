#include "label/Parser.hpp"
#include "label/rules.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <boost/algorithm/string.hpp>

namespace cw::label {

namespace {

using svmatch = std::match_results<std::string_view::const_iterator>;

bool isBlank(const std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](const unsigned char c) { return std::isspace(c) != 0; });
}

}

std::vector<std::string> extractTags(const std::string_view content, const Markers& markers) {
    std::vector<std::string> tags;
    if (markers.open.empty() || markers.close.empty()) return tags;

    size_t pos = 0;
    while (true) {
        const auto open = content.find(markers.open, pos);
        if (open == std::string_view::npos) break;

        const auto bodyStart = open + markers.open.size();
        const auto close = content.find(markers.close, bodyStart);
        if (close == std::string_view::npos) break;

        tags.emplace_back(content.substr(bodyStart, close - bodyStart));
        pos = close + markers.close.size();
    }

    return tags;
}

std::optional<Label> parse(const std::string_view tag) {
    if (tag.empty() || isBlank(tag)) return std::nullopt;

    try {
        static const std::regex channelRe(R"(\[([A-Za-z0-9\-]+)\])");

        Label label;
        std::string rest;

        svmatch m;
        if (std::regex_search(tag.begin(), tag.end(), m, channelRe)) {
            label.channel = boost::algorithm::trim_copy(m[1].str());
            rest = boost::algorithm::trim_copy(std::string(m[0].second, tag.end()));
        } else {
            rest = boost::algorithm::trim_copy(std::string(tag));
        }

        const auto kind = rules::firstOf(rules::KIND_RULES, rest);
        if (!kind || kind->empty()) return std::nullopt;
        label.kind = *kind;

        label.payload = rules::firstOf(rules::PAYLOAD_RULES, rest).value_or("");
        return label;
    } catch (const std::exception&) {
        // regex_error / length_error: the tag is treated as unparseable
        return std::nullopt;
    }
}

std::vector<Label> extractLabels(const std::string_view content, const Markers& markers) {
    std::vector<Label> labels;
    for (const auto& tag : extractTags(content, markers))
        if (auto label = parse(tag)) labels.push_back(std::move(*label));
    return labels;
}

std::vector<Label> filterByKind(const std::vector<Label>& labels, const std::vector<std::string>& allowedKinds) {
    std::vector<Label> filtered;
    std::copy_if(labels.begin(), labels.end(), std::back_inserter(filtered), [&](const Label& l) {
        return std::any_of(allowedKinds.begin(), allowedKinds.end(), [&](const std::string& kind) {
            return boost::algorithm::iequals(l.kind, kind);
        });
    });
    return filtered;
}

bool hasAllowedLabels(const std::string_view content, const std::vector<std::string>& allowedKinds,
                      const Markers& markers) {
    return !filterByKind(extractLabels(content, markers), allowedKinds).empty();
}

bool hasMatch(const std::string_view content, const std::string& pattern,
              const std::vector<std::string>& allowedKinds, const Markers& markers) {
    if (pattern.empty() || pattern == ALLOW_LIST_PATTERN)
        return hasAllowedLabels(content, allowedKinds, markers);

    const auto tags = extractTags(content, markers);
    if (tags.empty()) return false;

    for (const auto& tag : tags)
        if (tag.find(pattern) != std::string::npos) return true;

    std::regex re;
    try {
        re = std::regex(pattern);
    } catch (const std::regex_error&) {
        return false;  // not an expression; the literal pass already ran
    }

    for (const auto& tag : tags) {
        try {
            if (std::regex_search(tag, re)) return true;
        } catch (const std::regex_error&) {
            return false;  // complexity / stack limits
        }
    }

    return false;
}

std::optional<std::string> extractField(const std::string_view content, const std::string& fieldId) {
    const std::string open = "<f id=" + fieldId;

    size_t pos = 0;
    while ((pos = content.find(open, pos)) != std::string_view::npos) {
        const auto after = pos + open.size();
        // the id must end here: "<f id=title>" or "<f id=title attr=...>"
        if (after < content.size() && content[after] != '>' && !std::isspace(static_cast<unsigned char>(content[after]))) {
            pos = after;
            continue;
        }

        const auto gt = content.find('>', after);
        if (gt == std::string_view::npos) return std::nullopt;

        const auto valueEnd = content.find('<', gt + 1);
        if (valueEnd == std::string_view::npos) return std::nullopt;
        if (content.substr(valueEnd, 4) != "</f>") {
            pos = gt;
            continue;
        }

        return std::string(content.substr(gt + 1, valueEnd - gt - 1));
    }

    return std::nullopt;
}

StoryInfo extractStoryInfo(const std::string_view content, const std::vector<std::string>& allowedKinds,
                           const Markers& markers) {
    StoryInfo info;
    info.title = extractField(content, "title").value_or("");
    info.status = extractField(content, "status").value_or("");
    info.modify_by = extractField(content, "modify-by").value_or("");
    info.modify_date = extractField(content, "modify-date").value_or("");
    info.audio_time = extractField(content, "audio-time").value_or("");

    info.tags = extractTags(content, markers);
    for (const auto& tag : info.tags)
        if (auto label = parse(tag)) info.labels.push_back(std::move(*label));

    info.allowed_labels = filterByKind(info.labels, allowedKinds);
    for (const auto& l : info.allowed_labels)
        if (!l.payload.empty()) info.references.push_back(l.payload);

    return info;
}

}
