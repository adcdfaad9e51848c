#include "util/files.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

using namespace cw::util;

namespace fs = std::filesystem;

std::string cw::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void cw::util::atomicWrite(const fs::path& path, const std::string_view contents) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw std::runtime_error("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }

    const fs::path tmp = path.string() + ".tmp-" + generate_random_suffix();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp file: " + tmp.string());
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
    }
}

void cw::util::appendLine(const fs::path& path, const std::string_view line) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw std::runtime_error("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) throw std::runtime_error("Failed to open file for append: " + path.string());
    out << line << '\n';
    if (!out) throw std::runtime_error("Failed to append to file: " + path.string());
}

std::string cw::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}
