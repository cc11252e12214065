#pragma once

#include "fleetcrypt/journal.hpp"
#include "fleetcrypt/message.hpp"
#include "fleetcrypt/types.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fleetcrypt {

/**
 * Persistent vocabulary-frequency model built from clear text.
 *
 * Counts only ever grow. Each update() is journaled as one record holding all
 * of the message's increments, fsynced, and only then applied in memory, so a
 * message contributes completely or not at all.
 */
class FrequencyStore {
public:
    explicit FrequencyStore(std::filesystem::path journal_path);

    // Replay the journal. Throws StoreLockedError / IOError.
    void open();
    void close() noexcept;
    bool is_open() const noexcept { return journal_.is_open(); }

    /**
     * Count every body word of a CLEAR message, plus its sender and receiver
     * under their own namespaces when present. Returns false, touching
     * nothing, for CIPHER messages.
     * @throws IOError if the journal write fails; counts are then unchanged
     */
    bool update(const Message& message);

    /**
     * Stored words whose length equals `length`, most frequent first,
     * ties in alphabetical order.
     */
    std::vector<WordCount> candidates_of_length(size_t length, Field field = Field::WORD) const;

    uint64_t count(const std::string& word, Field field = Field::WORD) const;
    size_t size(Field field = Field::WORD) const;
    std::vector<WordCount> entries(Field field = Field::WORD) const;

    const std::filesystem::path& path() const noexcept { return journal_.path(); }

private:
    using Counts = std::map<std::string, uint64_t>;

    bool replay(const std::string& record);
    Counts& counts(Field field) { return counts_[static_cast<size_t>(field)]; }
    const Counts& counts(Field field) const { return counts_[static_cast<size_t>(field)]; }

    Journal journal_;
    std::array<Counts, 3> counts_;
};

} // namespace fleetcrypt
