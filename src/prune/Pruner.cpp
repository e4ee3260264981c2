#include "prune/Pruner.hpp"
#include "events/EventSink.hpp"
#include "fs/Backend.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <stdexcept>
#include <utility>

using namespace fc::prune;
using namespace fc::prune::model;
using namespace fc::events;
using namespace fc::fs::model;

static constexpr std::size_t NO_PARENT = std::numeric_limits<std::size_t>::max();

Pruner::Pruner(std::shared_ptr<fs::Backend> backend, std::shared_ptr<EventSink> sink)
    : backend_(std::move(backend)), sink_(std::move(sink)) {
    if (!backend_) throw std::invalid_argument("prune::Pruner requires a filesystem backend");
    if (!sink_) throw std::invalid_argument("prune::Pruner requires an event sink");
}

Stats Pruner::prune(const std::filesystem::path& root, const bool includeRoot) {
    stats_ = {};

    const auto present = backend_->exists(root);
    if (!present) {
        fail(present.error(), "checking cleanup root");
        return stats_;
    }
    if (!*present) {
        fail({ErrorKind::NotFound, root, "path does not exist"}, "cleanup root");
        return stats_;
    }

    const auto nodes = scan(root);
    if (isInterrupted()) return stats_;

    for (const auto* node : candidates(nodes, includeRoot)) {
        if (isInterrupted()) break;

        if (const auto st = backend_->removeDirectory(node->path); !st) {
            // Typically something appeared in it since the scan. Not retried.
            fail(st.error(), std::format("deleting {}", node->path.string()));
            continue;
        }

        ++stats_.directories_deleted;
        sink_->emit(makeEvent(Event::Kind::DIR_DELETED,
                              std::format("DELETING EMPTY: {}", node->path.string()), node->path));
    }

    log::Registry::prune()->debug("[prune::Pruner] {}: {} deleted, {} errors",
                                  root.string(), stats_.directories_deleted, stats_.errors);
    return stats_;
}

std::vector<Pruner::Node> Pruner::scan(const std::filesystem::path& root) {
    std::vector<Node> nodes;
    nodes.push_back({root, 0, NO_PARENT, false});

    std::vector<std::size_t> pending{0};
    while (!pending.empty()) {
        if (isInterrupted()) return nodes;

        const auto idx = pending.back();
        pending.pop_back();

        const auto entries = backend_->list(nodes[idx].path);
        if (!entries) {
            fail(entries.error(), std::format("reading {}", nodes[idx].path.string()));
            nodes[idx].hasContent = true; // unknown contents, keep it
            continue;
        }

        for (const auto& entry : *entries) {
            if (entry.isDirectory()) {
                nodes.push_back({entry.path, nodes[idx].depth + 1, idx, false});
                pending.push_back(nodes.size() - 1);
            } else {
                // Links and special files count too: rmdir would refuse the directory anyway.
                nodes[idx].hasContent = true;
            }
        }
    }

    // Children are always discovered after their parent, so one backwards pass settles every subtree.
    for (auto i = nodes.size(); i-- > 1;)
        if (nodes[i].hasContent) nodes[nodes[i].parent].hasContent = true;

    return nodes;
}

std::vector<const Pruner::Node*> Pruner::candidates(const std::vector<Node>& nodes, const bool includeRoot) {
    std::vector<const Node*> out;
    for (const auto& node : nodes) {
        if (node.hasContent) continue;
        if (node.parent == NO_PARENT && !includeRoot) continue;
        out.push_back(&node);
    }

    std::ranges::sort(out, [](const Node* a, const Node* b) {
        if (a->depth != b->depth) return a->depth > b->depth;
        return a->path < b->path;
    });
    return out;
}

void Pruner::fail(const Error& err, const std::string_view context) {
    ++stats_.errors;
    sink_->emit(makeEvent(Event::Kind::ERROR, std::format("ERROR {}: {}", context, err.toString()), err.path));
}

void Pruner::interrupt() { interruptFlag_.store(true); }

bool Pruner::isInterrupted() const { return interruptFlag_.load(); }
