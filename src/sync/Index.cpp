#include "sync/Index.hpp"
#include "util/files.hpp"

using namespace cw::sync;

std::string Index::quote(const std::string& field) {
    if (field.find_first_of(";\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string Index::render(const std::vector<IndexRecord>& records) {
    std::string out = std::string(HEADER) + "\n";
    for (const auto& r : records)
        out += quote(r.reference) + DELIMITER + quote(r.local_path.string()) + "\n";
    return out;
}

void Index::write(const std::vector<IndexRecord>& records) const {
    util::atomicWrite(file_, render(records));
}
