#pragma once

#include "fleetcrypt/types.hpp"

#include <blake3.h>

#include <span>
#include <string_view>

namespace fleetcrypt {

/**
 * BLAKE3 hashing for content identity, backed by the official libblake3.
 *
 * Used for:
 * 1. Message fingerprints: hash of the normalized message text
 * 2. Journal record checksums: truncated hash of the record payload
 */
class Blake3Hasher {
public:
    static Blake3Hash hash(std::span<const uint8_t> data) noexcept {
        return hash(data.data(), data.size());
    }

    static Blake3Hash hash(std::string_view str) noexcept {
        return hash(str.data(), str.size());
    }

private:
    static Blake3Hash hash(const void* data, size_t len) noexcept {
        Blake3Hash result;
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, data, len);
        blake3_hasher_finalize(&hasher, result.bytes.data(), BLAKE3_OUT_LEN);
        return result;
    }
};

} // namespace fleetcrypt
