#include "fleetcrypt/message.hpp"
#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/blake3.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace fleetcrypt {

namespace {

std::string to_upper(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool all_digits(const std::string& word) {
    return !word.empty() &&
           std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string join(const std::vector<std::string>& tokens) {
    std::string result;
    for (const auto& token : tokens) {
        if (!result.empty()) result += ' ';
        result += token;
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// Dictionary
// =============================================================================

Dictionary::Dictionary(std::initializer_list<std::string> words) {
    for (const auto& word : words) {
        insert(word);
    }
}

size_t Dictionary::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open dictionary", path.string(),
                      "Set FC_DICTIONARY to a word list, one word per line",
                      ErrorCode::FILE_NOT_FOUND);
    }

    size_t loaded = 0;
    size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto tokens = MessageParser::tokenize(line);
        if (tokens.size() != 1 || !is_word(tokens[0])) {
            if (!tokens.empty()) ++skipped;
            continue;
        }
        if (words_.insert(tokens[0]).second) ++loaded;
    }

    LOG_INFO("Loaded ", loaded, " dictionary words from ", path.string(),
             skipped ? " (" + std::to_string(skipped) + " lines skipped)" : "");
    return loaded;
}

void Dictionary::insert(std::string_view word) {
    words_.insert(to_upper(word));
}

bool Dictionary::contains(std::string_view word) const {
    return words_.find(std::string(word)) != words_.end();
}

// =============================================================================
// Message
// =============================================================================

std::string Message::to_text() const {
    std::vector<std::string> tokens;
    if (sender) tokens.push_back("=" + *sender);
    tokens.insert(tokens.end(), body.begin(), body.end());
    if (receiver) tokens.push_back(*receiver + "=");
    return join(tokens);
}

Fingerprint fingerprint_text(std::string_view normalized_text) {
    return Blake3Hasher::hash(normalized_text).to_hex();
}

// =============================================================================
// MessageParser
// =============================================================================

MessageParser::MessageParser(const Dictionary& dictionary, ParserOptions options)
    : dictionary_(dictionary)
    , options_(options) {}

std::vector<std::string> MessageParser::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos > start) {
            tokens.push_back(to_upper(text.substr(start, pos - start)));
        }
    }
    return tokens;
}

Message MessageParser::parse(std::string_view corrected_text) const {
    Message message;
    auto tokens = tokenize(corrected_text);
    message.normalized_text = join(tokens);
    message.fingerprint = fingerprint_text(message.normalized_text);

    size_t first = 0;
    size_t last = tokens.size();

    // Sender: "=NAME" in first position. The marker token is consumed even
    // when what follows it is unusable.
    if (first < last && tokens[first].front() == '=') {
        size_t start = tokens[first].find_first_not_of('=');
        std::string name = start == std::string::npos ? std::string() : tokens[first].substr(start);
        if (is_word(name)) {
            message.sender = name;
        } else {
            LOG_DEBUG("Unusable sender marker '", tokens[first], "'");
        }
        ++first;
    }

    // Receiver: "NAME=" in last position, never the sender's token.
    if (first < last && tokens[last - 1].back() == '=') {
        const std::string& token = tokens[last - 1];
        size_t end = token.find_last_not_of('=');
        std::string name = end == std::string::npos ? std::string() : token.substr(0, end + 1);
        if (is_word(name)) {
            message.receiver = name;
        } else {
            LOG_DEBUG("Unusable receiver marker '", token, "'");
        }
        --last;
    }

    for (size_t i = first; i < last; ++i) {
        const std::string& token = tokens[i];
        if (!is_word(token)) {
            LOG_DEBUG("Dropping token with non-alphabet symbols '", token, "'");
        } else if (token.front() == '-' || token.back() == '-') {
            // Stray dashes at a word edge are scan noise.
            LOG_DEBUG("Dropping token with edge dash '", token, "'");
        } else {
            message.body.push_back(token);
        }
    }

    message.classification = classify(message.body);

    if (!message.has_routing()) {
        LOG_WARN("Message has neither sender nor receiver: ", message.normalized_text);
    }

    return message;
}

Classification MessageParser::classify(const std::vector<std::string>& body) const {
    if (body.empty()) return Classification::CIPHER;

    size_t clear_words = static_cast<size_t>(
        std::count_if(body.begin(), body.end(), [this](const std::string& w) { return is_clear_word(w); }));

    if (static_cast<double>(clear_words) > static_cast<double>(body.size()) * options_.clear_threshold) {
        return Classification::CLEAR;
    }
    return Classification::CIPHER;
}

bool MessageParser::is_clear_word(const std::string& word) const {
    return all_digits(word) || dictionary_.contains(word);
}

} // namespace fleetcrypt
