#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cw::sync {

struct IndexRecord {
    std::string reference;
    std::filesystem::path local_path;
};

// ';' delimited view of the downloaded assets, header "URL;LOCAL PATH".
class Index {
public:
    static constexpr char DELIMITER = ';';
    static constexpr const char* HEADER = "URL;LOCAL PATH";

    explicit Index(std::filesystem::path file) : file_(std::move(file)) {}

    [[nodiscard]] static std::string render(const std::vector<IndexRecord>& records);

    // Writes atomically. Throws std::runtime_error.
    void write(const std::vector<IndexRecord>& records) const;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;

    static std::string quote(const std::string& field);
};

}
