#include "cli/Args.hpp"

#include <format>
#include <string_view>
#include <utility>

using namespace fc::cli;
using namespace fc::config;

namespace {

bool takesValue(const std::string_view flag) {
    return flag == "--config" || flag == "-c" || flag == "--dest" || flag == "-d" ||
           flag == "--source" || flag == "-s" || flag == "--log-file" || flag == "--report";
}

ArgsParse invalid(std::string msg) { return {false, {}, std::move(msg)}; }

}

ArgsParse fc::cli::parseArgs(const std::vector<std::string>& args) {
    ArgsParse out{.ok = true};
    auto& o = out.options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> value;

        // --flag=value
        if (const auto eq = flag.find('='); flag.starts_with("--") && eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        }

        if (takesValue(flag)) {
            if (!value) {
                if (i + 1 >= args.size()) return invalid(std::format("Option {} requires a value", flag));
                value = args[++i];
            }
            if (value->empty()) return invalid(std::format("Option {} requires a non-empty value", flag));

            if (flag == "--config" || flag == "-c") o.config_path = *value;
            else if (flag == "--dest" || flag == "-d") o.destination = *value;
            else if (flag == "--source" || flag == "-s") o.sources.emplace_back(*value);
            else if (flag == "--log-file") o.log_file = *value;
            else if (flag == "--report") o.report_path = *value;
            continue;
        }

        if (value) return invalid(std::format("Option {} does not take a value", flag));

        if (flag == "--no-cleanup") o.no_cleanup = true;
        else if (flag == "--cleanup-only") o.cleanup_only = true;
        else if (flag == "--include-root") o.include_root = true;
        else if (flag == "--verbose" || flag == "-v") o.verbose = true;
        else if (flag == "--help" || flag == "-h") o.help = true;
        else return invalid(std::format("Unknown argument: {}", flag));
    }

    if (o.no_cleanup && o.cleanup_only) return invalid("--no-cleanup and --cleanup-only are mutually exclusive");
    return out;
}

Config fc::cli::resolveConfig(const Options& opts) {
    Config cfg = opts.config_path ? loadConfig(*opts.config_path) : Config{};

    if (opts.destination) cfg.merge.destination = *opts.destination;
    if (!opts.sources.empty()) cfg.merge.sources = opts.sources;
    if (opts.log_file) cfg.logging.log_file = *opts.log_file;
    if (opts.report_path) cfg.report.path = *opts.report_path;
    if (opts.no_cleanup) cfg.cleanup.enabled = false;
    if (opts.include_root) cfg.cleanup.include_root = true;

    if (opts.verbose) {
        cfg.logging.journal_to_console = true;
        cfg.logging.levels.console_log_level = spdlog::level::debug;
        auto& sub = cfg.logging.levels.subsystem_levels;
        sub.consolidator = sub.merge = sub.prune = spdlog::level::debug;
    }

    return cfg;
}

fc::runtime::Mode fc::cli::resolveMode(const Options& opts) {
    return opts.cleanup_only ? runtime::Mode::CleanupOnly : runtime::Mode::CleanupAndMerge;
}

std::string fc::cli::usage(const std::string& program) {
    return std::format(
        "Usage: {} [options]\n"
        "\n"
        "Removes empty folders from the source folders, then merges them into one\n"
        "destination. Identical files are skipped, different files and clashing\n"
        "folders get a _2, _3, ... suffix.\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE     YAML configuration file\n"
        "  -d, --dest DIR        destination folder (overrides config)\n"
        "  -s, --source DIR      source folder, repeatable (replaces the config list)\n"
        "      --log-file FILE   log file (default: <dest>/{})\n"
        "      --report FILE     write JSON statistics to FILE\n"
        "      --no-cleanup      skip empty folder removal\n"
        "      --cleanup-only    only remove empty folders, do not merge\n"
        "      --include-root    allow removing a source folder that is itself empty\n"
        "  -v, --verbose         log every decision to the console\n"
        "  -h, --help            show this help\n",
        program, DEFAULT_LOG_FILE_NAME);
}
