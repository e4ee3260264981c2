#pragma once

#include "config/Config.hpp"
#include "merge/model/Stats.hpp"
#include "prune/model/Stats.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json_fwd.hpp>

namespace fc::fs {
struct Backend;
}

namespace fc::events {
struct EventSink;
}

namespace fc::merge {
class Engine;
}

namespace fc::prune {
class Pruner;
}

namespace fc::runtime {

struct Report {
    prune::model::Stats cleanup{};
    merge::model::Stats merge{};
    bool cleanupRan = false;
    bool mergeRan = false;
    bool interrupted = false;
    std::chrono::milliseconds elapsed{};

    [[nodiscard]] uintmax_t totalErrors() const { return cleanup.errors + merge.errors; }
};

void to_json(nlohmann::json& j, const Report& r);

// Merge-only runs are expressed through CleanupConfig::enabled.
enum class Mode { CleanupAndMerge, CleanupOnly };

// Cleanup of every source first, then one merge run over all of them.
class Runner {
public:
    explicit Runner(config::Config cfg, Mode mode = Mode::CleanupAndMerge);
    Runner(config::Config cfg, Mode mode,
           std::shared_ptr<fs::Backend> backend,
           std::shared_ptr<events::EventSink> mergeSink,
           std::shared_ptr<events::EventSink> pruneSink);
    ~Runner();

    Report run();

    // Async-signal-safe.
    void interrupt();

    // Throws std::runtime_error when the file cannot be written.
    static void writeReport(const Report& report, const std::filesystem::path& path);

private:
    config::Config config_;
    Mode mode_;
    std::unique_ptr<prune::Pruner> pruner_;
    std::unique_ptr<merge::Engine> engine_;
    std::atomic<bool> interruptFlag_{false};

    prune::model::Stats runCleanup();
    void logStatistics(const Report& report) const;
};

}
