#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace fc::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. The log file is opened in append mode.
    static void init(const config::LoggingConfig& cnf, const std::filesystem::path& logFile);

    // Drops every logger so init() can run again (tests, or a second run in one process).
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> consolidator() { return get("consolidator"); }
    static std::shared_ptr<spdlog::logger> merge()        { return get("merge"); }
    static std::shared_ptr<spdlog::logger> prune()        { return get("prune"); }
    static std::shared_ptr<spdlog::logger> fs()           { return get("fs"); }
    static std::shared_ptr<spdlog::logger> journal()      { return get("journal"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::filesystem::path& logFile() { return log_file_path_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline std::filesystem::path log_file_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>   file_sink_;
};

}
