#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cw::label {

struct Label {
    std::string channel;  // e.g. CG1, empty when the tag has no [code]
    std::string kind;     // e.g. Faldon, X_Total; never empty
    std::string payload;  // URL or free text, may be empty

    bool operator==(const Label&) const = default;
};

// Header fields and labels of one rundown entry.
struct StoryInfo {
    std::string title;
    std::string status;
    std::string modify_by;
    std::string modify_date;
    std::string audio_time;
    std::vector<std::string> tags;
    std::vector<Label> labels;
    std::vector<Label> allowed_labels;
    std::vector<std::string> references;  // non-empty payloads of allowed_labels

    [[nodiscard]] bool hasTags() const { return !tags.empty(); }
};

void to_json(nlohmann::json& j, const Label& l);
void from_json(const nlohmann::json& j, Label& l);
void to_json(nlohmann::json& j, const StoryInfo& s);

}
