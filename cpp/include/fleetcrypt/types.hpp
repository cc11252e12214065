#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleetcrypt {

// =============================================================================
// Blake3Hash - 256-bit content identity
// =============================================================================
//
// Used as the message fingerprint for deduplication and, truncated, as the
// checksum of every journal record.
//
struct Blake3Hash {
    std::array<uint8_t, 32> bytes;

    constexpr Blake3Hash() noexcept : bytes{} {}

    bool operator==(const Blake3Hash& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const Blake3Hash& other) const noexcept {
        return !(*this == other);
    }

    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    static constexpr size_t size() noexcept { return 32; }
};

// A message fingerprint is the lowercase hex digest of its normalized text.
using Fingerprint = std::string;

// =============================================================================
// Vocabulary namespaces
// =============================================================================

// The frequency model keeps body words and the two routing fields apart:
// call signs and unit names recur in different positions than body text.
enum class Field : uint8_t {
    WORD = 0,
    SENDER = 1,
    RECEIVER = 2
};

constexpr const char* field_name(Field field) noexcept {
    switch (field) {
        case Field::WORD:     return "word";
        case Field::SENDER:   return "sender";
        case Field::RECEIVER: return "receiver";
    }
    return "unknown";
}

// Single-letter tag used in journal records.
constexpr char field_tag(Field field) noexcept {
    switch (field) {
        case Field::WORD:     return 'w';
        case Field::SENDER:   return 's';
        case Field::RECEIVER: return 'r';
    }
    return '?';
}

enum class Classification : uint8_t {
    CLEAR = 0,
    CIPHER = 1
};

constexpr const char* classification_name(Classification c) noexcept {
    return c == Classification::CLEAR ? "clear" : "cipher";
}

struct WordCount {
    std::string word;
    uint64_t count = 0;

    bool operator==(const WordCount& other) const noexcept {
        return word == other.word && count == other.count;
    }
};

// Per-position symbol offsets, each in [0, ALPHABET_SIZE).
using OffsetKey = std::vector<int>;

} // namespace fleetcrypt
