#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/error.hpp"

#include <charconv>
#include <sstream>

namespace fleetcrypt {

namespace {

// -1 for characters outside the alphabet
constexpr int ordinal_or_invalid(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '0' && c <= '9') return 26 + (c - '0');
    if (c == '=') return 36;
    if (c == '-') return 37;
    return -1;
}

constexpr int wrap(int value) noexcept {
    int m = value % ALPHABET_SIZE;
    return m < 0 ? m + ALPHABET_SIZE : m;
}

} // anonymous namespace

bool is_symbol(char c) noexcept {
    return ordinal_or_invalid(c) >= 0;
}

bool is_word(std::string_view word) noexcept {
    if (word.empty()) return false;
    for (char c : word) {
        if (!is_symbol(c)) return false;
    }
    return true;
}

int symbol_ordinal(char c) {
    int ord = ordinal_or_invalid(c);
    if (ord < 0) {
        FLEETCRYPT_THROW_INVALID_ARG(std::string("Invalid symbol '") + c + "'");
    }
    return ord;
}

char symbol_at(int ordinal) noexcept {
    return ALPHABET[static_cast<size_t>(wrap(ordinal))];
}

int offset(char cipher, char clear) {
    return wrap(symbol_ordinal(cipher) - symbol_ordinal(clear));
}

char apply_offset(char clear, int offset) {
    return symbol_at(symbol_ordinal(clear) + offset);
}

char remove_offset(char cipher, int offset) {
    return symbol_at(symbol_ordinal(cipher) - offset);
}

OffsetKey offset_sequence(std::string_view cipher_word, std::string_view clear_word) {
    if (cipher_word.size() != clear_word.size()) {
        FLEETCRYPT_THROW_INVALID_ARG("Word lengths differ: " + std::string(cipher_word) +
                                     " vs " + std::string(clear_word));
    }

    OffsetKey key;
    key.reserve(cipher_word.size());
    for (size_t i = 0; i < cipher_word.size(); ++i) {
        key.push_back(offset(cipher_word[i], clear_word[i]));
    }
    return key;
}

std::optional<std::string> encode_word(std::string_view clear_word, const OffsetKey& key) {
    if (clear_word.size() > key.size()) return std::nullopt;

    std::string result;
    result.reserve(clear_word.size());
    for (size_t i = 0; i < clear_word.size(); ++i) {
        result.push_back(apply_offset(clear_word[i], key[i]));
    }
    return result;
}

std::optional<std::string> decode_word(std::string_view cipher_word, const OffsetKey& key) {
    if (cipher_word.size() > key.size()) return std::nullopt;

    std::string result;
    result.reserve(cipher_word.size());
    for (size_t i = 0; i < cipher_word.size(); ++i) {
        result.push_back(remove_offset(cipher_word[i], key[i]));
    }
    return result;
}

std::optional<OffsetKey> extend_periodic(const OffsetKey& key, size_t period, size_t length) {
    if (length <= key.size()) return key;
    if (period == 0 || key.size() < period) return std::nullopt;

    for (size_t i = period; i < key.size(); ++i) {
        if (key[i] != key[i % period]) return std::nullopt;
    }

    OffsetKey extended = key;
    extended.reserve(length);
    for (size_t i = key.size(); i < length; ++i) {
        extended.push_back(key[i % period]);
    }
    return extended;
}

std::string format_key(const OffsetKey& key) {
    std::ostringstream ss;
    for (size_t i = 0; i < key.size(); ++i) {
        if (i) ss << ' ';
        ss << key[i];
    }
    return ss.str();
}

std::optional<OffsetKey> parse_key(std::string_view text) {
    OffsetKey key;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == ',' || text[pos] == '\t')) ++pos;
        if (pos >= text.size()) break;

        size_t end = pos;
        while (end < text.size() && text[end] != ' ' && text[end] != ',' && text[end] != '\t') ++end;

        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + end, value);
        if (ec != std::errc() || ptr != text.data() + end) return std::nullopt;
        if (value < 0 || value >= ALPHABET_SIZE) return std::nullopt;

        key.push_back(value);
        pos = end;
    }

    if (key.empty()) return std::nullopt;
    return key;
}

} // namespace fleetcrypt
