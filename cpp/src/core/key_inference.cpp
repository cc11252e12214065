#include "fleetcrypt/key_inference.hpp"
#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/logging.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace fleetcrypt {

namespace {

// A distinct cipher word and the namespace its candidates come from.
struct Witness {
    Field field;
    std::string word;
};

// One cipher word lined up against one stored clear word.
struct Evidence {
    size_t witness;
    std::string clear_word;
    uint64_t count;
    OffsetKey offsets;
};

// Distinct per namespace: a receiver spelled like a body word is still tried
// against the receiver vocabulary.
std::vector<Witness> collect_witnesses(const Message& message) {
    std::vector<Witness> witnesses;
    std::set<std::pair<Field, std::string>> seen;

    auto add = [&](Field field, const std::string& word) {
        if (seen.emplace(field, word).second) {
            witnesses.push_back({field, word});
        }
    };

    for (const auto& word : message.body) {
        add(Field::WORD, word);
    }
    if (message.sender) add(Field::SENDER, *message.sender);
    if (message.receiver) add(Field::RECEIVER, *message.receiver);
    return witnesses;
}

bool is_prefix_of(const OffsetKey& prefix, const OffsetKey& key) {
    return prefix.size() <= key.size() &&
           std::equal(prefix.begin(), prefix.end(), key.begin());
}

} // anonymous namespace

bool ranks_before(const CandidateKey& a, const CandidateKey& b) {
    if (a.weight != b.weight) return a.weight > b.weight;
    if (a.completeness != b.completeness) return a.completeness == Completeness::FULL;
    if (a.cipher_words.size() != b.cipher_words.size()) {
        return a.cipher_words.size() > b.cipher_words.size();
    }
    return a.offsets < b.offsets;
}

KeyInferenceEngine::KeyInferenceEngine(EngineOptions options)
    : options_(options) {}

std::vector<CandidateKey> KeyInferenceEngine::infer(const Message& cipher_message,
                                                    const FrequencyStore& freq) const {
    auto witnesses = collect_witnesses(cipher_message);

    std::vector<Evidence> evidence;
    std::set<OffsetKey> keys;
    for (size_t i = 0; i < witnesses.size(); ++i) {
        const auto& witness = witnesses[i];
        for (auto& candidate : freq.candidates_of_length(witness.word.size(), witness.field)) {
            OffsetKey offsets = offset_sequence(witness.word, candidate.word);
            keys.insert(offsets);
            evidence.push_back({i, std::move(candidate.word), candidate.count, std::move(offsets)});
        }
    }

    if (evidence.empty()) {
        LOG_DEBUG("No length-compatible vocabulary for ", witnesses.size(), " cipher words");
        return {};
    }

    std::vector<CandidateKey> result;
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        // Lexicographic order puts every extension of a key right after it;
        // a key extended by a longer one is absorbed into that key.
        auto next = std::next(it);
        if (next != keys.end() && next->size() > it->size() && is_prefix_of(*it, *next)) {
            continue;
        }

        CandidateKey candidate;
        candidate.offsets = *it;
        size_t body_words = 0;

        // One cipher word and key fix the clear word, so each witness
        // contributes at most one match.
        for (const auto& e : evidence) {
            if (!is_prefix_of(e.offsets, candidate.offsets)) continue;
            const auto& witness = witnesses[e.witness];
            candidate.matches.push_back({witness.field, witness.word, e.clear_word, e.count});
            candidate.weight += e.count;
            candidate.cipher_words.push_back(witness.word);
            if (witness.field == Field::WORD) ++body_words;
        }

        std::sort(candidate.cipher_words.begin(), candidate.cipher_words.end());
        candidate.cipher_words.erase(
            std::unique(candidate.cipher_words.begin(), candidate.cipher_words.end()),
            candidate.cipher_words.end());
        // Routing names add weight but only body words make a key FULL.
        candidate.completeness = body_words >= options_.group_count
                                     ? Completeness::FULL
                                     : Completeness::PARTIAL;
        result.push_back(std::move(candidate));
    }

    std::sort(result.begin(), result.end(), ranks_before);
    if (options_.max_candidates > 0 && result.size() > options_.max_candidates) {
        result.resize(options_.max_candidates);
    }

    LOG_DEBUG("Inferred ", result.size(), " candidate keys from ", evidence.size(),
              " word alignments");
    return result;
}

} // namespace fleetcrypt
