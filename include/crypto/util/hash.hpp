#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fc::crypto::hash {

inline constexpr std::size_t DIGEST_BYTES = 16; // 128-bit BLAKE2b
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;

struct Digest {
    std::array<unsigned char, DIGEST_BYTES> bytes{};

    friend bool operator==(const Digest&, const Digest&) = default;

    [[nodiscard]] std::string toHex() const;
};

// Streams the file through BLAKE2b in chunkSize reads. Throws std::runtime_error
// if the file cannot be opened or a read fails midway.
Digest blake2b(const std::filesystem::path& filepath, std::size_t chunkSize = DEFAULT_CHUNK_SIZE);

}
