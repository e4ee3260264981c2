#include "runtime/Runner.hpp"
#include "events/EventSink.hpp"
#include "fs/LocalBackend.hpp"
#include "log/Registry.hpp"
#include "merge/Engine.hpp"
#include "prune/Pruner.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

using namespace fc::runtime;
using namespace fc::config;
using namespace fc::events;
using namespace std::chrono;

static const std::string BANNER(60, '=');

void fc::runtime::to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"cleanup", r.cleanup},
        {"merge", r.merge},
        {"cleanup_ran", r.cleanupRan},
        {"merge_ran", r.mergeRan},
        {"interrupted", r.interrupted},
        {"total_errors", r.totalErrors()},
        {"elapsed_ms", r.elapsed.count()}
    };
}

Runner::Runner(Config cfg, const Mode mode)
    : Runner(std::move(cfg), mode, nullptr, nullptr, nullptr) {}

Runner::Runner(Config cfg, const Mode mode,
               std::shared_ptr<fs::Backend> backend,
               std::shared_ptr<EventSink> mergeSink,
               std::shared_ptr<EventSink> pruneSink)
    : config_(std::move(cfg)), mode_(mode) {
    config_.validate();

    if (!backend) backend = std::make_shared<fs::LocalBackend>(config_.hashing.chunk_size);
    if (!mergeSink) mergeSink = std::make_shared<LogSink>(log::Registry::merge(), log::Registry::journal());
    if (!pruneSink) pruneSink = std::make_shared<LogSink>(log::Registry::prune(), log::Registry::journal());

    pruner_ = std::make_unique<prune::Pruner>(backend, std::move(pruneSink));
    engine_ = std::make_unique<merge::Engine>(config_.merge, std::move(backend), std::move(mergeSink));
}

Runner::~Runner() = default;

Report Runner::run() {
    const auto logger = log::Registry::consolidator();
    const auto started = steady_clock::now();
    Report report;

    logger->info(BANNER);
    logger->info(mode_ == Mode::CleanupOnly ? "EMPTY FOLDER CLEANUP STARTED" : "FOLDER CONSOLIDATION STARTED");
    logger->info(BANNER);
    logger->info("Master Folder: {}", config_.merge.destination.string());
    logger->info("Sources: {} folder(s)", config_.merge.sources.size());

    if (mode_ == Mode::CleanupOnly || config_.cleanup.enabled) {
        report.cleanup = runCleanup();
        report.cleanupRan = true;
    }

    if (mode_ != Mode::CleanupOnly && !interruptFlag_.load()) {
        report.merge = engine_->run();
        report.mergeRan = true;
    }

    report.interrupted = interruptFlag_.load();
    report.elapsed = duration_cast<milliseconds>(steady_clock::now() - started);

    logger->info(BANNER);
    if (report.interrupted) logger->warn("CANCELLED BY USER");
    else logger->info(mode_ == Mode::CleanupOnly ? "CLEANUP COMPLETE" : "CONSOLIDATION COMPLETE");
    logger->info(BANNER);
    logStatistics(report);
    return report;
}

fc::prune::model::Stats Runner::runCleanup() {
    const auto logger = log::Registry::consolidator();
    prune::model::Stats total;

    const auto& sources = config_.merge.sources;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        if (interruptFlag_.load()) break;
        logger->info("[{}/{}] Cleaning: {}", i + 1, sources.size(), sources[i].string());
        total += pruner_->prune(sources[i], config_.cleanup.include_root);
    }

    return total;
}

void Runner::logStatistics(const Report& report) const {
    const auto logger = log::Registry::consolidator();

    logger->info("STATISTICS:");
    if (report.cleanupRan) {
        logger->info("  Empty Folders Deleted: {}", report.cleanup.directories_deleted);
        logger->info("  Cleanup Errors:        {}", report.cleanup.errors);
    }
    if (report.mergeRan) {
        logger->info("  Folders Created:  {}", report.merge.directories_created);
        logger->info("  Folders Renamed:  {}", report.merge.directories_renamed);
        logger->info("  Files Copied:     {}", report.merge.files_copied);
        logger->info("  Files Renamed:    {}", report.merge.files_renamed);
        logger->info("  Files Skipped:    {}", report.merge.files_skipped);
        logger->info("  Errors:           {}", report.merge.errors);
    }
    logger->info("  Elapsed:          {:.1f}s", static_cast<double>(report.elapsed.count()) / 1000.0);
    logger->info("Log saved to: {}", log::Registry::logFile().string());
}

void Runner::interrupt() {
    interruptFlag_.store(true);
    pruner_->interrupt();
    engine_->interrupt();
}

void Runner::writeReport(const Report& report, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) throw std::runtime_error("Failed to create report directory: " + path.parent_path().string());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open report file: " + path.string());

    out << nlohmann::json(report).dump(2) << '\n';
    if (!out) throw std::runtime_error("Failed to write report file: " + path.string());
}
