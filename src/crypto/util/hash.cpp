#include "crypto/util/hash.hpp"

#include <sodium.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

static_assert(fc::crypto::hash::DIGEST_BYTES >= crypto_generichash_BYTES_MIN &&
              fc::crypto::hash::DIGEST_BYTES <= crypto_generichash_BYTES_MAX);

namespace fc::crypto::hash {

std::string Digest::toHex() const {
    std::ostringstream result;
    for (const auto b : bytes)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return result.str();
}

Digest blake2b(const std::filesystem::path& filepath, std::size_t chunkSize) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    if (chunkSize == 0) chunkSize = DEFAULT_CHUNK_SIZE;

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, DIGEST_BYTES);

    std::vector<char> buffer(chunkSize);
    while (file.good()) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(buffer.data()),
                                  static_cast<unsigned long long>(file.gcount()));
    }

    if (file.bad()) throw std::runtime_error("Read failed while hashing: " + filepath.string());

    Digest digest;
    crypto_generichash_final(&state, digest.bytes.data(), digest.bytes.size());
    return digest;
}

}
