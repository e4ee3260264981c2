#pragma once

#include "crypto/util/hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace fc::config {

inline constexpr const char* DEFAULT_LOG_FILE_NAME = "consolidation_log.txt";

// What the merge engine needs, nothing more. Owned by the caller, copied into the engine.
struct MergeConfig {
    std::filesystem::path destination{};
    std::vector<std::filesystem::path> sources{};
};

struct CleanupConfig {
    bool enabled = true;
    bool include_root = false; // the source root itself is never removed unless asked
};

struct HashingConfig {
    std::size_t chunk_size = crypto::hash::DEFAULT_CHUNK_SIZE;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum consolidator = spdlog::level::info; // banners and statistics
    spdlog::level::level_enum merge        = spdlog::level::info; // per-entry copy/skip/rename decisions
    spdlog::level::level_enum prune        = spdlog::level::info; // empty directory removal
    spdlog::level::level_enum fs           = spdlog::level::warn; // low level backend chatter
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_file{}; // empty -> <destination>/consolidation_log.txt
    bool journal_to_console = false;  // also show per-file decisions on the terminal
    LogLevelsConfig levels;
};

struct ReportConfig {
    std::filesystem::path path{}; // empty -> no JSON report
};

struct Config {
    MergeConfig merge;
    CleanupConfig cleanup;
    HashingConfig hashing;
    LoggingConfig logging;
    ReportConfig report;

    // Throws std::invalid_argument when there is nothing sensible to run.
    void validate() const;

    [[nodiscard]] std::filesystem::path resolvedLogFile() const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

}
