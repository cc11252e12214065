#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fleetcrypt {

/**
 * Append-only record journal.
 *
 * On-disk form is one record per line:
 *
 *     <payload> TAB <checksum> LF
 *
 * where the checksum is the first 16 hex digits of BLAKE3(payload). Every
 * append is a single write() followed by fsync(), so a crash leaves either
 * the complete record or a prefix of it. On open, an unterminated tail is a
 * torn append and is truncated away; a terminated line whose checksum does
 * not match is skipped and reported.
 *
 * The file is held under an exclusive flock() for the journal's lifetime.
 */
class Journal {
public:
    explicit Journal(std::filesystem::path path);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    /**
     * Open (creating if missing), lock, and read back every intact record.
     * @throws StoreLockedError if another open journal holds the file
     * @throws IOError on any other open/read/truncate failure
     */
    std::vector<std::string> open();

    /**
     * Durably append one record. The payload must be non-empty and contain
     * no TAB or newline.
     * @throws IOError if the journal is closed or the write/fsync fails; the
     *         file is rolled back to its previous length where possible
     */
    void append(std::string_view payload);

    void close() noexcept;

    bool is_open() const noexcept { return fd_ >= 0; }
    const std::filesystem::path& path() const noexcept { return path_; }

    // Records skipped or truncated during the last open().
    size_t discarded_records() const noexcept { return discarded_; }

    static std::string checksum(std::string_view payload);

private:
    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t size_ = 0;
    size_t discarded_ = 0;
};

} // namespace fleetcrypt
