#pragma once

#include "fleetcrypt/frequency_store.hpp"
#include "fleetcrypt/message.hpp"
#include "fleetcrypt/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleetcrypt {

enum class Completeness : uint8_t {
    FULL = 0,
    PARTIAL = 1
};

constexpr const char* completeness_name(Completeness c) noexcept {
    return c == Completeness::FULL ? "full" : "partial";
}

// One cipher word explained by one known clear word under a key.
struct KeyMatch {
    Field field = Field::WORD;
    std::string cipher_word;
    std::string clear_word;
    uint64_t count = 0;  // stored frequency of clear_word
};

struct CandidateKey {
    OffsetKey offsets;
    uint64_t weight = 0;                    // sum of match counts
    std::vector<std::string> cipher_words;  // sorted, distinct
    std::vector<KeyMatch> matches;          // in message order
    Completeness completeness = Completeness::PARTIAL;

    bool is_full() const noexcept { return completeness == Completeness::FULL; }
};

struct EngineOptions {
    // Corroborating cipher words needed to call a key FULL. The game cipher
    // has four code knobs.
    size_t group_count = 4;
    // 0 keeps every candidate.
    size_t max_candidates = 0;
};

/**
 * Proposes substitution keys for a cipher message by lining its words up
 * against known clear words of the same length.
 *
 * Each (cipher word, stored clear word) pair of equal length yields a literal
 * offset sequence, weighted by the clear word's frequency. Sequences agree
 * when one is a prefix of the other, so shorter words corroborate keys found
 * from longer ones. Keys are ranked by total weight.
 *
 * Known limitation: the ranking assumes distinct clear words give distinct
 * offset patterns against one cipher word, so agreement between independent
 * cipher words is taken as strong evidence. Nothing guarantees the top key
 * is the true one.
 */
class KeyInferenceEngine {
public:
    explicit KeyInferenceEngine(EngineOptions options = {});

    // Empty when nothing in the store lines up with the message.
    std::vector<CandidateKey> infer(const Message& cipher_message, const FrequencyStore& freq) const;

    const EngineOptions& options() const noexcept { return options_; }

private:
    EngineOptions options_;
};

// Ranking order: weight desc, FULL before PARTIAL, more cipher words,
// then offsets ascending.
bool ranks_before(const CandidateKey& a, const CandidateKey& b);

} // namespace fleetcrypt
