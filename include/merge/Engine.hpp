#pragma once

#include "config/Config.hpp"
#include "events/Event.hpp"
#include "fs/model/Result.hpp"
#include "merge/model/Stats.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fc::fs {
struct Backend;
}

namespace fc::events {
struct EventSink;
}

namespace fc::merge {

// Replicates the union of the source trees under the destination root.
//
// Files: absent -> copy; present and byte-identical -> skip; present and different ->
// copy to the first free "<stem>_N<ext>". Directories: absent -> create; present ->
// create the first free "<name>_N" and send the whole incoming subtree there, so two
// same-named directories from different sources never interleave.
//
// Nothing in here throws for a filesystem failure. Each one is counted in Stats::errors,
// reported as an ERROR event, and the walk moves on to the next sibling.
class Engine {
public:
    Engine(config::MergeConfig cfg,
           std::shared_ptr<fs::Backend> backend,
           std::shared_ptr<events::EventSink> sink);

    // Creates the destination root once and merges every source root in configured order.
    // Counters start from zero on each call.
    model::Stats run();

    // Merges the contents of one source root into the destination root.
    void mergeSource(const std::filesystem::path& sourceRoot);

    // Safe to call from a signal handler. The walk stops before the next entry.
    void interrupt();
    [[nodiscard]] bool isInterrupted() const;

    [[nodiscard]] const model::Stats& stats() const { return stats_; }
    [[nodiscard]] const config::MergeConfig& config() const { return config_; }

private:
    struct PendingDir {
        std::filesystem::path source, destination;
    };

    config::MergeConfig config_;
    std::shared_ptr<fs::Backend> backend_;
    std::shared_ptr<events::EventSink> sink_;
    model::Stats stats_{};
    std::atomic<bool> interruptFlag_{false};
    std::filesystem::path destinationKey_{};

    bool prepareDestination();
    void processDirectory(const std::filesystem::path& sourceDir,
                          const std::filesystem::path& destDir,
                          std::vector<PendingDir>& pending);

    void mergeFile(const std::filesystem::path& source, const std::filesystem::path& dest);
    std::optional<std::filesystem::path> mergeDirectory(const std::filesystem::path& source,
                                                        const std::filesystem::path& destParent);

    bool identical(const std::filesystem::path& source, const std::filesystem::path& dest);
    [[nodiscard]] bool isDestinationRoot(const std::filesystem::path& path) const;

    void fail(const fs::model::Error& err, std::string_view context);
    void emit(events::Event::Kind kind, std::string detail,
              const std::filesystem::path& source = {}, const std::filesystem::path& dest = {});
};

}
