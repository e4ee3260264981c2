#include "log/Registry.hpp"

#include <stdexcept>
#include <vector>

namespace fc::log {

void Registry::init(const config::LoggingConfig& cnf, const std::filesystem::path& logFile) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_file_path_ = logFile;
    if (log_file_path_.has_parent_path() && !std::filesystem::exists(log_file_path_.parent_path()))
        std::filesystem::create_directories(log_file_path_.parent_path());

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // append-only log file shared by every logger
    file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path_.string(), /*truncate=*/false);
    file_sink_->set_level(cnf.levels.file_log_level);
    file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("consolidator", sub_levels.consolidator);
    makeLogger("merge",        sub_levels.merge);
    makeLogger("prune",        sub_levels.prune);
    makeLogger("fs",           sub_levels.fs);

    // journal: file-only unless asked, for the per-entry events that would flood the terminal
    {
        std::vector<spdlog::sink_ptr> sinks = { file_sink_ };
        if (cnf.journal_to_console) sinks.push_back(console_sink_);
        const auto logger = std::make_shared<spdlog::logger>("journal", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    consolidator()->debug("[log::Registry] Initialized, writing to {}", log_file_path_.string());
}

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : {"consolidator", "merge", "prune", "fs", "journal"}) {
        if (const auto logger = spdlog::get(name)) logger->flush();
        spdlog::drop(name);
    }
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
