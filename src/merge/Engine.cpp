#include "merge/Engine.hpp"
#include "events/EventSink.hpp"
#include "fs/Backend.hpp"
#include "fs/naming.hpp"
#include "log/Registry.hpp"

#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace fc::merge;
using namespace fc::merge::model;
using namespace fc::events;
using namespace fc::fs::model;

using Kind = Event::Kind;

static std::filesystem::path comparableKey(const std::filesystem::path& path) {
    std::error_code ec;
    auto key = std::filesystem::weakly_canonical(path, ec);
    if (ec) return std::filesystem::absolute(path, ec).lexically_normal();
    return key;
}

Engine::Engine(config::MergeConfig cfg,
               std::shared_ptr<fs::Backend> backend,
               std::shared_ptr<EventSink> sink)
    : config_(std::move(cfg)), backend_(std::move(backend)), sink_(std::move(sink)) {
    if (!backend_) throw std::invalid_argument("merge::Engine requires a filesystem backend");
    if (!sink_) throw std::invalid_argument("merge::Engine requires an event sink");
    if (config_.destination.empty()) throw std::invalid_argument("merge::Engine requires a destination root");
}

Stats Engine::run() {
    stats_ = {};
    if (!prepareDestination()) return stats_;

    const auto total = config_.sources.size();
    for (std::size_t i = 0; i < total; ++i) {
        if (isInterrupted()) break;
        log::Registry::merge()->info("[{}/{}] Processing: {}", i + 1, total, config_.sources[i].string());
        mergeSource(config_.sources[i]);
    }

    if (isInterrupted()) log::Registry::merge()->warn("[merge::Engine] Interrupted, destination left as is");
    return stats_;
}

bool Engine::prepareDestination() {
    // The root itself is reused across sources and never goes through conflict renaming.
    if (const auto st = backend_->createDirectories(config_.destination); !st) {
        fail(st.error(), "creating destination root");
        return false;
    }
    destinationKey_ = comparableKey(config_.destination);
    return true;
}

void Engine::mergeSource(const std::filesystem::path& sourceRoot) {
    if (destinationKey_.empty()) destinationKey_ = comparableKey(config_.destination);

    const auto present = backend_->exists(sourceRoot);
    if (!present) {
        fail(present.error(), "checking source root");
        return;
    }
    if (!*present) {
        fail({ErrorKind::NotFound, sourceRoot, "source root does not exist"}, "source not found");
        return;
    }

    std::vector<PendingDir> pending;
    processDirectory(sourceRoot, config_.destination, pending);

    while (!pending.empty() && !isInterrupted()) {
        const auto next = std::move(pending.back());
        pending.pop_back();
        processDirectory(next.source, next.destination, pending);
    }
}

void Engine::processDirectory(const std::filesystem::path& sourceDir,
                              const std::filesystem::path& destDir,
                              std::vector<PendingDir>& pending) {
    const auto entries = backend_->list(sourceDir);
    if (!entries) {
        fail(entries.error(), std::format("reading folder {}", sourceDir.string()));
        return;
    }

    for (const auto& entry : *entries) {
        if (isInterrupted()) return;

        switch (entry.type) {
        case EntryType::File:
            mergeFile(entry.path, destDir / entry.path.filename());
            break;

        case EntryType::Directory:
            if (isDestinationRoot(entry.path)) {
                emit(Kind::WARNING, std::format("Skipping {}: it is the destination root", entry.path.string()),
                     entry.path);
                break;
            }
            if (auto dest = mergeDirectory(entry.path, destDir)) pending.push_back({entry.path, std::move(*dest)});
            break;

        case EntryType::Symlink:
            emit(Kind::WARNING, std::format("Skipping link {}: not a regular file", entry.path.string()), entry.path);
            break;

        case EntryType::Other:
            log::Registry::merge()->debug("[merge::Engine] Ignoring {} {}", to_string(entry.type), entry.path.string());
            break;
        }
    }
}

void Engine::mergeFile(const std::filesystem::path& source, const std::filesystem::path& dest) {
    const auto present = backend_->exists(dest);
    if (!present) {
        fail(present.error(), std::format("checking {}", dest.string()));
        return;
    }

    if (!*present) {
        if (const auto st = backend_->copyFile(source, dest); !st) {
            fail(st.error(), std::format("copying file {}", source.string()));
            return;
        }
        ++stats_.files_copied;
        emit(Kind::FILE_COPIED, std::format("COPY: {}", dest.string()), source, dest);
        return;
    }

    if (identical(source, dest)) {
        ++stats_.files_skipped;
        emit(Kind::FILE_SKIPPED, std::format("SKIP (identical): {}", dest.string()), source, dest);
        return;
    }

    const auto target = fs::availableName(*backend_, dest, NameKind::File);
    if (!target) {
        fail(target.error(), std::format("finding a free name for {}", dest.string()));
        return;
    }

    if (const auto st = backend_->copyFile(source, *target); !st) {
        fail(st.error(), std::format("copying file {}", source.string()));
        return;
    }
    ++stats_.files_renamed;
    emit(Kind::FILE_RENAMED,
         std::format("RENAME FILE: {} -> {}", dest.filename().string(), target->filename().string()),
         source, *target);
}

std::optional<std::filesystem::path> Engine::mergeDirectory(const std::filesystem::path& source,
                                                            const std::filesystem::path& destParent) {
    const auto dest = destParent / source.filename();

    const auto present = backend_->exists(dest);
    if (!present) {
        fail(present.error(), std::format("checking {}", dest.string()));
        return std::nullopt;
    }

    if (!*present) {
        if (const auto st = backend_->createDirectory(dest); !st) {
            fail(st.error(), std::format("creating folder {}", dest.string()));
            return std::nullopt;
        }
        ++stats_.directories_created;
        emit(Kind::DIR_CREATED, std::format("FOLDER: {}", dest.string()), source, dest);
        return dest;
    }

    const auto sibling = fs::availableName(*backend_, dest, NameKind::Directory);
    if (!sibling) {
        fail(sibling.error(), std::format("finding a free name for {}", dest.string()));
        return std::nullopt;
    }

    if (const auto st = backend_->createDirectory(*sibling); !st) {
        fail(st.error(), std::format("creating folder {}", sibling->string()));
        return std::nullopt;
    }
    ++stats_.directories_renamed;
    emit(Kind::DIR_RENAMED,
         std::format("CONFLICT: Folder '{}' exists -> '{}'", dest.filename().string(), sibling->filename().string()),
         source, *sibling);
    return *sibling;
}

bool Engine::identical(const std::filesystem::path& source, const std::filesystem::path& dest) {
    // Different sizes can never hash equal; skip reading either file.
    const auto sourceSize = backend_->fileSize(source);
    const auto destSize = backend_->fileSize(dest);
    if (sourceSize && destSize && *sourceSize != *destSize) return false;

    // Anything we cannot verify is treated as different, so it gets copied aside, never dropped.
    const auto a = backend_->digest(source);
    if (!a) {
        emit(Kind::WARNING, std::format("Could not hash file: {}", a.error().toString()), source, dest);
        return false;
    }

    const auto b = backend_->digest(dest);
    if (!b) {
        emit(Kind::WARNING, std::format("Could not hash file: {}", b.error().toString()), source, dest);
        return false;
    }

    return *a == *b;
}

bool Engine::isDestinationRoot(const std::filesystem::path& path) const {
    return !destinationKey_.empty() && comparableKey(path) == destinationKey_;
}

void Engine::fail(const Error& err, const std::string_view context) {
    ++stats_.errors;
    emit(Kind::ERROR, std::format("ERROR {}: {}", context, err.toString()), err.path);
}

void Engine::emit(const Kind kind, std::string detail,
                  const std::filesystem::path& source, const std::filesystem::path& dest) {
    auto event = makeEvent(kind, std::move(detail), source, dest);
    sink_->emit(event);
}

void Engine::interrupt() { interruptFlag_.store(true); }

bool Engine::isInterrupted() const { return interruptFlag_.load(); }
