#pragma once

#include "fleetcrypt/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fleetcrypt {

// =============================================================================
// Symbol alphabet
// =============================================================================
//
// Radio traffic uses a closed set of 38 symbols. Ordinals run A-Z (0-25),
// 0-9 (26-35), '=' (36), '-' (37); the substitution cipher shifts each symbol
// by a per-position offset modulo the alphabet size.
//

inline constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789=-";
inline constexpr int ALPHABET_SIZE = static_cast<int>(ALPHABET.size());

bool is_symbol(char c) noexcept;

// True for a non-empty string made only of alphabet symbols.
bool is_word(std::string_view word) noexcept;

// Throws InvalidArgumentError for characters outside the alphabet.
int symbol_ordinal(char c);

// Any integer, negative included, wraps onto the alphabet.
char symbol_at(int ordinal) noexcept;

/**
 * Offset that turns `clear` into `cipher`:
 *   (ord(cipher) - ord(clear)) mod ALPHABET_SIZE
 */
int offset(char cipher, char clear);

char apply_offset(char clear, int offset);
char remove_offset(char cipher, int offset);

/**
 * Per-position offsets between two words of equal length.
 * Throws InvalidArgumentError when lengths differ or a word is invalid.
 */
OffsetKey offset_sequence(std::string_view cipher_word, std::string_view clear_word);

// Encrypt a clear word with the leading offsets of `key`.
// Returns nullopt when the word is longer than the key.
std::optional<std::string> encode_word(std::string_view clear_word, const OffsetKey& key);

// Reverse `key` over a cipher word. Returns nullopt when the word is longer
// than the key: positions past the key's end have no known offset.
std::optional<std::string> decode_word(std::string_view cipher_word, const OffsetKey& key);

// The game cipher repeats one offset per code knob along the word. A key
// covering at least `period` positions and repeating with that period is
// extended cyclically to `length`; a key already long enough comes back as
// is. Anything else yields nullopt.
std::optional<OffsetKey> extend_periodic(const OffsetKey& key, size_t period, size_t length);

// "2 2 2 2 2"
std::string format_key(const OffsetKey& key);

// Inverse of format_key; rejects empty input, non-numeric tokens and
// offsets outside [0, ALPHABET_SIZE).
std::optional<OffsetKey> parse_key(std::string_view text);

} // namespace fleetcrypt
