#pragma once

#include "config/Config.hpp"
#include "runtime/Runner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fc::cli {

struct Options {
    std::optional<std::filesystem::path> config_path{};
    std::optional<std::filesystem::path> destination{};
    std::vector<std::filesystem::path> sources{};
    std::optional<std::filesystem::path> log_file{};
    std::optional<std::filesystem::path> report_path{};
    bool no_cleanup = false;
    bool cleanup_only = false;
    bool include_root = false;
    bool verbose = false;
    bool help = false;
};

struct ArgsParse {
    bool ok = false;
    Options options;
    std::string error;
};

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_WITH_ERRORS = 1;
inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_INTERRUPTED = 130;

ArgsParse parseArgs(const std::vector<std::string>& args);

// Config file (when given) first, then command line overrides. Does not validate.
config::Config resolveConfig(const Options& opts);

runtime::Mode resolveMode(const Options& opts);

std::string usage(const std::string& program = "fc-consolidate");

}
