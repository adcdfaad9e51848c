#pragma once

#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <utility>

namespace cw::runtime {

// Shared, read-only environment handed to every component at construction.
struct Context {
    config::Config config;
    std::shared_ptr<logging::LogRegistry> logs;

    Context(config::Config config, std::shared_ptr<logging::LogRegistry> logs)
        : config(std::move(config)), logs(std::move(logs)) {}
};

}
