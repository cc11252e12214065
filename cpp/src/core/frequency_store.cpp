#include "fleetcrypt/frequency_store.hpp"
#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace fleetcrypt {

namespace {

// Record payload: space-separated "<tag>:<WORD>" increments, e.g.
//   w:ENEMY w:FLEET w:SIGHTED s:HQ r:FLEET7
std::string encode_increment(Field field, const std::string& word) {
    std::string token;
    token.reserve(word.size() + 2);
    token.push_back(field_tag(field));
    token.push_back(':');
    token.append(word);
    return token;
}

std::optional<Field> field_from_tag(char tag) {
    switch (tag) {
        case 'w': return Field::WORD;
        case 's': return Field::SENDER;
        case 'r': return Field::RECEIVER;
        default:  return std::nullopt;
    }
}

} // anonymous namespace

FrequencyStore::FrequencyStore(std::filesystem::path journal_path)
    : journal_(std::move(journal_path)) {}

void FrequencyStore::open() {
    for (auto& c : counts_) c.clear();

    auto records = journal_.open();
    size_t applied = 0;
    for (const auto& record : records) {
        if (replay(record)) ++applied;
    }

    LOG_INFO("Frequency store ", path().string(), ": ", applied, " messages, ",
             size(Field::WORD), " words, ", size(Field::SENDER), " senders, ",
             size(Field::RECEIVER), " receivers");
}

void FrequencyStore::close() noexcept {
    journal_.close();
}

// All-or-nothing per record: a record with any unreadable increment is skipped.
bool FrequencyStore::replay(const std::string& record) {
    std::vector<std::pair<Field, std::string>> increments;

    size_t pos = 0;
    while (pos < record.size()) {
        size_t end = record.find(' ', pos);
        if (end == std::string::npos) end = record.size();
        std::string_view token(record.data() + pos, end - pos);
        pos = end + 1;
        if (token.empty()) continue;

        auto field = field_from_tag(token.front());
        if (!field || token.size() < 3 || token[1] != ':' || !is_word(token.substr(2))) {
            LOG_WARN("Skipping frequency record with bad increment '", token, "'");
            return false;
        }
        increments.emplace_back(*field, std::string(token.substr(2)));
    }

    for (const auto& [field, word] : increments) {
        ++counts(field)[word];
    }
    return !increments.empty();
}

bool FrequencyStore::update(const Message& message) {
    if (!message.is_clear()) {
        LOG_DEBUG("Not counting cipher message ", message.fingerprint.substr(0, 12));
        return false;
    }

    std::vector<std::pair<Field, const std::string*>> increments;
    for (const auto& word : message.body) {
        increments.emplace_back(Field::WORD, &word);
    }
    if (message.sender) {
        increments.emplace_back(Field::SENDER, &*message.sender);
    }
    if (message.receiver) {
        increments.emplace_back(Field::RECEIVER, &*message.receiver);
    }

    if (increments.empty()) {
        return true;
    }

    // Anything replay would reject must not reach the journal.
    for (const auto& [field, word] : increments) {
        FLEETCRYPT_CHECK_ARGUMENT(is_word(*word),
                                  std::string("Not a countable ") + field_name(field) + ": '" + *word + "'");
    }

    std::string record;
    for (const auto& [field, word] : increments) {
        if (!record.empty()) record.push_back(' ');
        record += encode_increment(field, *word);
    }

    journal_.append(record);

    for (const auto& [field, word] : increments) {
        ++counts(field)[*word];
    }

    LOG_DEBUG("Counted ", increments.size(), " words from ", message.fingerprint.substr(0, 12));
    return true;
}

std::vector<WordCount> FrequencyStore::candidates_of_length(size_t length, Field field) const {
    std::vector<WordCount> result;
    for (const auto& [word, count] : counts(field)) {
        // Filter on the requested length, not on the stored word itself.
        if (word.size() == length) {
            result.push_back({word, count});
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const WordCount& a, const WordCount& b) {
        return a.count > b.count;
    });
    return result;
}

uint64_t FrequencyStore::count(const std::string& word, Field field) const {
    const auto& c = counts(field);
    auto it = c.find(word);
    return it == c.end() ? 0 : it->second;
}

size_t FrequencyStore::size(Field field) const {
    return counts(field).size();
}

std::vector<WordCount> FrequencyStore::entries(Field field) const {
    std::vector<WordCount> result;
    result.reserve(counts(field).size());
    for (const auto& [word, count] : counts(field)) {
        result.push_back({word, count});
    }
    return result;
}

} // namespace fleetcrypt
