#pragma once

#include "label/Label.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cw::label {

inline const std::vector<std::string> DEFAULT_ALLOWED_KINDS = {"X_Total", "X_Faldon"};

// Filter value that selects entries carrying at least one allow-listed label.
// The empty filter behaves the same way.
inline constexpr std::string_view ALLOW_LIST_PATTERN = "LABELS";

struct Markers {
    std::string open = "<ap>";
    std::string close = "</ap>";
};

// Raw text between each open/close marker pair, left to right, non-overlapping.
std::vector<std::string> extractTags(std::string_view content, const Markers& markers = {});

// Never throws; a tag that yields no kind is std::nullopt.
std::optional<Label> parse(std::string_view tag);

std::vector<Label> extractLabels(std::string_view content, const Markers& markers = {});

// Case-insensitive match of Label::kind against allowedKinds.
std::vector<Label> filterByKind(const std::vector<Label>& labels,
                                const std::vector<std::string>& allowedKinds = DEFAULT_ALLOWED_KINDS);

bool hasAllowedLabels(std::string_view content,
                      const std::vector<std::string>& allowedKinds = DEFAULT_ALLOWED_KINDS,
                      const Markers& markers = {});

// Pattern is tried as a substring of each tag, then as a regular expression.
// A malformed expression matches nothing.
bool hasMatch(std::string_view content, const std::string& pattern,
              const std::vector<std::string>& allowedKinds = DEFAULT_ALLOWED_KINDS,
              const Markers& markers = {});

// Value of <f id=fieldId ...>value</f>
std::optional<std::string> extractField(std::string_view content, const std::string& fieldId);

StoryInfo extractStoryInfo(std::string_view content,
                           const std::vector<std::string>& allowedKinds = DEFAULT_ALLOWED_KINDS,
                           const Markers& markers = {});

}
