#pragma once

#include "fleetcrypt/frequency_store.hpp"
#include "fleetcrypt/key_inference.hpp"
#include "fleetcrypt/message.hpp"
#include "fleetcrypt/seen_log.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fleetcrypt {

// =============================================================================
// Outcomes
// =============================================================================

// The message was processed before; nothing was changed.
struct Duplicate {
    Message message;
};

// A clear message (or a confirmed decode) was counted and recorded seen.
struct FrequencyUpdated {
    Message message;
};

// A cipher message. Candidates may be empty, and the message is not recorded
// seen until a key is confirmed.
struct KeySuggestions {
    Message message;
    std::vector<CandidateKey> candidates;
};

using Outcome = std::variant<Duplicate, FrequencyUpdated, KeySuggestions>;

struct SessionOptions {
    // Consult the seen-message log before processing.
    bool deduplicate = true;
};

// Conventional journal names inside a data directory.
inline constexpr const char* FREQUENCY_JOURNAL = "frequency.journal";
inline constexpr const char* SEEN_JOURNAL = "seen_messages.journal";

/**
 * Single owner of the persistent stores for one operator session.
 *
 * process(): parse -> seen-log check -> count (clear) or infer (cipher).
 * confirm(): decode a cipher message with an operator-chosen key, count the
 * decoded words and record the cipher message seen.
 *
 * A fingerprint is recorded only after the store update it stands for has
 * been made durable. Persistence failures propagate as IOError.
 */
class Session {
public:
    Session(const Dictionary& dictionary,
            std::unique_ptr<FrequencyStore> frequency,
            std::unique_ptr<SeenLog> seen,
            ParserOptions parser_options = {},
            EngineOptions engine_options = {},
            SessionOptions options = {});

    // Open both stores under `data_dir`.
    static std::unique_ptr<Session> open(const Dictionary& dictionary,
                                         const std::filesystem::path& data_dir,
                                         ParserOptions parser_options = {},
                                         EngineOptions engine_options = {},
                                         SessionOptions options = {});

    Outcome process(std::string_view corrected_text);

    Outcome confirm(std::string_view corrected_text, const OffsetKey& key);

    // Preview of what `key` turns the message into; changes nothing.
    Message decode(std::string_view corrected_text, const OffsetKey& key) const;

    void close() noexcept;

    const MessageParser& parser() const noexcept { return parser_; }
    const FrequencyStore& frequency_store() const noexcept { return *frequency_; }
    const SeenLog& seen_log() const noexcept { return *seen_; }

private:
    bool is_duplicate(const Message& message) const;
    bool decodable(const std::string& word, const OffsetKey& key) const;
    Message decode_message(const Message& cipher, const OffsetKey& key) const;

    MessageParser parser_;
    std::unique_ptr<FrequencyStore> frequency_;
    std::unique_ptr<SeenLog> seen_;
    KeyInferenceEngine engine_;
    SessionOptions options_;
};

} // namespace fleetcrypt
