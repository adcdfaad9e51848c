#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cw::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to "<path>.tmp-<suffix>" and renames over path. Throws std::runtime_error.
void atomicWrite(const std::filesystem::path& path, std::string_view contents);

// Appends one line, creating the file and its parent directory as needed.
void appendLine(const std::filesystem::path& path, std::string_view line);

std::string generate_random_suffix(size_t length = 8);

}
