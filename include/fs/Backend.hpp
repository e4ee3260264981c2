#pragma once

#include "fs/model/Entry.hpp"
#include "fs/model/Result.hpp"
#include "crypto/util/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fc::fs {

// Every filesystem touch the engine and pruner make goes through here. Nothing throws;
// failures come back as model::Error so callers can count them and keep going.
struct Backend {
    virtual ~Backend() = default;

    [[nodiscard]] virtual model::Result<bool> exists(const std::filesystem::path& path) const = 0;
    [[nodiscard]] virtual model::Result<std::vector<model::Entry>> list(const std::filesystem::path& dir) const = 0;
    [[nodiscard]] virtual model::Result<uintmax_t> fileSize(const std::filesystem::path& path) const = 0;
    [[nodiscard]] virtual model::Result<crypto::hash::Digest> digest(const std::filesystem::path& path) const = 0;

    // Single level. A directory already present at path counts as success.
    virtual model::Status createDirectory(const std::filesystem::path& path) = 0;
    virtual model::Status createDirectories(const std::filesystem::path& path) = 0;

    // Never overwrites, an existing target is left untouched. Carries over mtime and permission
    // bits; a partially written destination created by this call is removed before the error is returned.
    virtual model::Status copyFile(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

    // rmdir semantics: fails on a non-empty directory.
    virtual model::Status removeDirectory(const std::filesystem::path& path) = 0;
};

}
