#include "fleetcrypt/session.hpp"
#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"

#include <system_error>

namespace fleetcrypt {

Session::Session(const Dictionary& dictionary,
                 std::unique_ptr<FrequencyStore> frequency,
                 std::unique_ptr<SeenLog> seen,
                 ParserOptions parser_options,
                 EngineOptions engine_options,
                 SessionOptions options)
    : parser_(dictionary, parser_options)
    , frequency_(std::move(frequency))
    , seen_(std::move(seen))
    , engine_(engine_options)
    , options_(options) {
    if (!frequency_ || !seen_) {
        FLEETCRYPT_THROW_INVALID_ARG("Session requires a frequency store and a seen-message log");
    }
}

std::unique_ptr<Session> Session::open(const Dictionary& dictionary,
                                       const std::filesystem::path& data_dir,
                                       ParserOptions parser_options,
                                       EngineOptions engine_options,
                                       SessionOptions options) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        throw IOError("Cannot create data directory: " + ec.message(), data_dir.string(), "",
                      ErrorCode::PERMISSION_DENIED);
    }

    auto frequency = std::make_unique<FrequencyStore>(data_dir / FREQUENCY_JOURNAL);
    auto seen = std::make_unique<SeenLog>(data_dir / SEEN_JOURNAL);
    frequency->open();
    seen->open();

    return std::make_unique<Session>(dictionary, std::move(frequency), std::move(seen),
                                     parser_options, engine_options, options);
}

bool Session::is_duplicate(const Message& message) const {
    return options_.deduplicate && seen_->contains(message.fingerprint);
}

Outcome Session::process(std::string_view corrected_text) {
    Message message = parser_.parse(corrected_text);

    if (is_duplicate(message)) {
        LOG_INFO("Already processed: ", message.normalized_text);
        return Duplicate{std::move(message)};
    }

    if (message.is_clear()) {
        // Counts must be durable before the message may be recorded seen.
        frequency_->update(message);
        seen_->record(message.fingerprint);
        LOG_INFO("Counted clear message with ", message.body.size(), " body words");
        return FrequencyUpdated{std::move(message)};
    }

    auto candidates = engine_.infer(message, *frequency_);
    if (candidates.empty()) {
        LOG_INFO("No key suggestions for cipher message: ", message.normalized_text);
    } else {
        LOG_INFO(candidates.size(), " key suggestions, best [", format_key(candidates.front().offsets),
                 "] weight ", candidates.front().weight, " (",
                 completeness_name(candidates.front().completeness), ")");
    }
    return KeySuggestions{std::move(message), std::move(candidates)};
}

Outcome Session::confirm(std::string_view corrected_text, const OffsetKey& key) {
    FLEETCRYPT_CHECK_ARGUMENT(!key.empty(), "Empty key");

    Message cipher = parser_.parse(corrected_text);
    if (is_duplicate(cipher)) {
        LOG_INFO("Already processed: ", cipher.normalized_text);
        return Duplicate{std::move(cipher)};
    }
    if (cipher.is_clear()) {
        LOG_WARN("Confirming a key for a message that parses as clear text");
    }

    Message clear = decode_message(cipher, key);

    // Undecodable words must not enter the vocabulary.
    Message feedback;
    if (cipher.sender && decodable(*cipher.sender, key)) feedback.sender = clear.sender;
    if (cipher.receiver && decodable(*cipher.receiver, key)) feedback.receiver = clear.receiver;
    for (size_t i = 0; i < cipher.body.size(); ++i) {
        if (decodable(cipher.body[i], key)) {
            feedback.body.push_back(clear.body[i]);
        }
    }
    feedback.fingerprint = cipher.fingerprint;
    feedback.classification = Classification::CLEAR;

    frequency_->update(feedback);
    seen_->record(cipher.fingerprint);

    LOG_INFO("Confirmed key [", format_key(key), "]: ", clear.normalized_text);
    return FrequencyUpdated{std::move(clear)};
}

Message Session::decode(std::string_view corrected_text, const OffsetKey& key) const {
    return decode_message(parser_.parse(corrected_text), key);
}

bool Session::decodable(const std::string& word, const OffsetKey& key) const {
    return extend_periodic(key, engine_.options().group_count, word.size()).has_value();
}

// Words the key cannot reach are left as they are.
Message Session::decode_message(const Message& cipher, const OffsetKey& key) const {
    const size_t period = engine_.options().group_count;
    auto decode_or_keep = [&key, period](const std::string& word) {
        auto full = extend_periodic(key, period, word.size());
        return full ? decode_word(word, *full).value_or(word) : word;
    };

    Message clear;
    if (cipher.sender) clear.sender = decode_or_keep(*cipher.sender);
    if (cipher.receiver) clear.receiver = decode_or_keep(*cipher.receiver);
    clear.body.reserve(cipher.body.size());
    for (const auto& word : cipher.body) {
        clear.body.push_back(decode_or_keep(word));
    }
    clear.normalized_text = clear.to_text();
    clear.fingerprint = cipher.fingerprint;
    clear.classification = parser_.classify(clear.body);
    return clear;
}

void Session::close() noexcept {
    frequency_->close();
    seen_->close();
}

} // namespace fleetcrypt
