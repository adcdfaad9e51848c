#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cw::runtime {

struct Options {
    std::filesystem::path config_path = "config.yaml";
    bool once = false;
    bool help = false;
};

// Throws std::invalid_argument for unknown flags or a missing value.
Options parseArgs(const std::vector<std::string>& args);

std::string usage(const std::string& program);

}
