#pragma once

#include "events/Event.hpp"
#include "fs/model/Result.hpp"
#include "prune/model/Stats.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fc::fs {
struct Backend;
}

namespace fc::events {
struct EventSink;
}

namespace fc::prune {

// Deletes every directory under a root that has no files anywhere beneath it.
//
// The tree is scanned once; a directory is empty iff no non-directory entry exists in
// its subtree. Removing an empty child never gives its parent a file, so deleting the
// candidates deepest first is enough for parents of empty chains to go too.
// A directory that cannot be listed counts one error and is treated as non-empty,
// which also keeps every ancestor.
class Pruner {
public:
    Pruner(std::shared_ptr<fs::Backend> backend, std::shared_ptr<events::EventSink> sink);

    model::Stats prune(const std::filesystem::path& root, bool includeRoot = false);

    void interrupt();
    [[nodiscard]] bool isInterrupted() const;

private:
    struct Node {
        std::filesystem::path path;
        std::size_t depth{};
        std::size_t parent{};
        bool hasContent = false;
    };

    std::shared_ptr<fs::Backend> backend_;
    std::shared_ptr<events::EventSink> sink_;
    model::Stats stats_{};
    std::atomic<bool> interruptFlag_{false};

    std::vector<Node> scan(const std::filesystem::path& root);
    static std::vector<const Node*> candidates(const std::vector<Node>& nodes, bool includeRoot);

    void fail(const fs::model::Error& err, std::string_view context);
};

}
