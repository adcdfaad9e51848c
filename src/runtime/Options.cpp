#include "runtime/Options.hpp"

#include <stdexcept>
#include <fmt/format.h>

using namespace cw::runtime;

Options cw::runtime::parseArgs(const std::vector<std::string>& args) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (a == "--once" || a == "-o") opts.once = true;
        else if (a == "--help" || a == "-h") opts.help = true;
        else if (a == "--config" || a == "-c") {
            if (i + 1 >= args.size()) throw std::invalid_argument(fmt::format("{} requires a path", a));
            opts.config_path = args[++i];
        } else if (a.starts_with("--config=")) {
            opts.config_path = a.substr(9);
            if (opts.config_path.empty()) throw std::invalid_argument("--config requires a path");
        } else throw std::invalid_argument(fmt::format("unknown argument: {}", a));
    }

    return opts;
}

std::string cw::runtime::usage(const std::string& program) {
    return fmt::format(
        "usage: {} [--config|-c PATH] [--once|-o] [--help|-h]\n"
        "\n"
        "  -c, --config PATH   configuration file (default: config.yaml)\n"
        "  -o, --once          run a single round and exit\n"
        "  -h, --help          show this help\n",
        program);
}
