#pragma once

#include "fs/Backend.hpp"

#include <cstddef>

namespace fc::fs {

struct LocalBackend : Backend {
    explicit LocalBackend(std::size_t hashChunkSize = crypto::hash::DEFAULT_CHUNK_SIZE);

    [[nodiscard]] model::Result<bool> exists(const std::filesystem::path& path) const override;
    [[nodiscard]] model::Result<std::vector<model::Entry>> list(const std::filesystem::path& dir) const override;
    [[nodiscard]] model::Result<uintmax_t> fileSize(const std::filesystem::path& path) const override;
    [[nodiscard]] model::Result<crypto::hash::Digest> digest(const std::filesystem::path& path) const override;

    model::Status createDirectory(const std::filesystem::path& path) override;
    model::Status createDirectories(const std::filesystem::path& path) override;
    model::Status copyFile(const std::filesystem::path& from, const std::filesystem::path& to) override;
    model::Status removeDirectory(const std::filesystem::path& path) override;

    [[nodiscard]] std::size_t hashChunkSize() const { return hashChunkSize_; }

private:
    std::size_t hashChunkSize_;
};

}
