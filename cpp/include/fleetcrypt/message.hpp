#pragma once

#include "fleetcrypt/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fleetcrypt {

// =============================================================================
// Dictionary - static reference word list
// =============================================================================

class Dictionary {
public:
    Dictionary() = default;
    explicit Dictionary(std::initializer_list<std::string> words);

    // One word per line, case-insensitive. Lines that are not alphabet words
    // after upper-casing are skipped. Returns the number of words loaded.
    // Throws IOError when the file cannot be opened.
    size_t load(const std::filesystem::path& path);

    void insert(std::string_view word);
    bool contains(std::string_view word) const;
    size_t size() const noexcept { return words_.size(); }

private:
    std::unordered_set<std::string> words_;
};

// =============================================================================
// Message - one parsed, operator-confirmed capture
// =============================================================================

struct Message {
    std::string normalized_text;          // tokens joined by single spaces
    Fingerprint fingerprint;              // BLAKE3 hex of normalized_text
    std::optional<std::string> sender;    // first token, "=NAME"
    std::optional<std::string> receiver;  // last token, "NAME="
    std::vector<std::string> body;        // reading order
    Classification classification = Classification::CIPHER;

    bool has_routing() const noexcept { return sender.has_value() || receiver.has_value(); }
    bool is_clear() const noexcept { return classification == Classification::CLEAR; }

    // Reassemble "=SENDER BODY... RECEIVER=" from the parsed fields.
    std::string to_text() const;
};

Fingerprint fingerprint_text(std::string_view normalized_text);

// =============================================================================
// MessageParser
// =============================================================================

struct ParserOptions {
    // A message is clear when more than this fraction of its body words are
    // dictionary words or numbers.
    double clear_threshold = 0.25;
};

class MessageParser {
public:
    explicit MessageParser(const Dictionary& dictionary, ParserOptions options = {});

    // Never throws on malformed input: bad tokens are dropped and undetectable
    // routing fields are left empty.
    Message parse(std::string_view corrected_text) const;

    Classification classify(const std::vector<std::string>& body) const;

    // Split into upper-cased whitespace-separated tokens.
    static std::vector<std::string> tokenize(std::string_view text);

    const ParserOptions& options() const noexcept { return options_; }

private:
    bool is_clear_word(const std::string& word) const;

    const Dictionary& dictionary_;
    ParserOptions options_;
};

} // namespace fleetcrypt
