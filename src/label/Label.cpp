#include "label/Label.hpp"

#include <nlohmann/json.hpp>

namespace cw::label {

void to_json(nlohmann::json& j, const Label& l) {
    j = {
        {"channel", l.channel},
        {"kind", l.kind},
        {"payload", l.payload}
    };
}

void from_json(const nlohmann::json& j, Label& l) {
    l.channel = j.value("channel", "");
    l.kind = j.at("kind").get<std::string>();
    l.payload = j.value("payload", "");
}

void to_json(nlohmann::json& j, const StoryInfo& s) {
    j = {
        {"title", s.title},
        {"status", s.status},
        {"modify_by", s.modify_by},
        {"modify_date", s.modify_date},
        {"audio_time", s.audio_time},
        {"has_tags", s.hasTags()},
        {"labels", s.labels},
        {"allowed_labels", s.allowed_labels},
        {"references", s.references}
    };
}

}
