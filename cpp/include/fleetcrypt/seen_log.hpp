#pragma once

#include "fleetcrypt/journal.hpp"
#include "fleetcrypt/types.hpp"

#include <filesystem>
#include <unordered_set>

namespace fleetcrypt {

// Append-only set of processed message fingerprints.
class SeenLog {
public:
    explicit SeenLog(std::filesystem::path journal_path);

    void open();
    void close() noexcept;
    bool is_open() const noexcept { return journal_.is_open(); }

    bool contains(const Fingerprint& fingerprint) const;

    /**
     * Durably record a fingerprint. Recording one already present is a no-op.
     * @return true if the fingerprint was newly written
     * @throws IOError if the append fails; membership is then unchanged
     */
    bool record(const Fingerprint& fingerprint);

    size_t size() const noexcept { return seen_.size(); }
    const std::filesystem::path& path() const noexcept { return journal_.path(); }

private:
    Journal journal_;
    std::unordered_set<Fingerprint> seen_;
};

} // namespace fleetcrypt
