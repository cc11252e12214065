#include "fleetcrypt/journal.hpp"
#include "fleetcrypt/blake3.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fleetcrypt {

namespace {

constexpr size_t CHECKSUM_HEX_LEN = 16;
constexpr char FIELD_SEPARATOR = '\t';
constexpr char RECORD_TERMINATOR = '\n';

std::string errno_message(const char* op) {
    return std::string(op) + " failed: " + std::strerror(errno);
}

} // anonymous namespace

Journal::Journal(std::filesystem::path path)
    : path_(std::move(path)) {}

Journal::~Journal() {
    close();
}

std::string Journal::checksum(std::string_view payload) {
    return Blake3Hasher::hash(payload).to_hex().substr(0, CHECKSUM_HEX_LEN);
}

std::vector<std::string> Journal::open() {
    if (is_open()) {
        FLEETCRYPT_THROW(ErrorCode::INTERNAL_ERROR, "Journal already open: " + path_.string());
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        ErrorCode code = errno == EACCES ? ErrorCode::PERMISSION_DENIED : ErrorCode::FILE_NOT_FOUND;
        throw IOError(errno_message("open"), path_.string(), "", code);
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            throw StoreLockedError(path_.string());
        }
        errno = err;
        throw IOError(errno_message("flock"), path_.string());
    }

    // Read the whole file; journals hold one short line per message.
    std::string contents;
    char buf[8192];
    for (;;) {
        ssize_t n = ::pread(fd, buf, sizeof(buf), static_cast<off_t>(contents.size()));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_message("read");
            ::close(fd);
            throw IOError(msg, path_.string());
        }
        if (n == 0) break;
        contents.append(buf, static_cast<size_t>(n));
    }

    std::vector<std::string> records;
    discarded_ = 0;
    size_t pos = 0;
    size_t line_no = 0;
    while (pos < contents.size()) {
        size_t eol = contents.find(RECORD_TERMINATOR, pos);
        if (eol == std::string::npos) break;  // torn tail
        ++line_no;

        std::string_view line(contents.data() + pos, eol - pos);
        pos = eol + 1;

        size_t sep = line.rfind(FIELD_SEPARATOR);
        if (sep == std::string_view::npos || sep == 0) {
            LOG_WARN(path_.filename().string(), ":", line_no, " malformed record skipped");
            ++discarded_;
            continue;
        }

        std::string_view payload = line.substr(0, sep);
        std::string_view sum = line.substr(sep + 1);
        if (sum != checksum(payload)) {
            LOG_WARN(path_.filename().string(), ":", line_no, " checksum mismatch, record skipped");
            ++discarded_;
            continue;
        }

        records.emplace_back(payload);
    }

    if (pos < contents.size()) {
        LOG_WARN("Truncating ", contents.size() - pos, " bytes of incomplete record at end of ",
                 path_.string());
        if (::ftruncate(fd, static_cast<off_t>(pos)) != 0 || ::fsync(fd) != 0) {
            std::string msg = errno_message("ftruncate");
            ::close(fd);
            throw IOError(msg, path_.string());
        }
        ++discarded_;
    }

    fd_ = fd;
    size_ = pos;

    LOG_DEBUG("Opened ", path_.string(), " with ", records.size(), " records");
    return records;
}

void Journal::append(std::string_view payload) {
    if (!is_open()) {
        throw IOError("Journal is not open", path_.string(), "", ErrorCode::FILE_NOT_FOUND);
    }
    FLEETCRYPT_CHECK_ARGUMENT(!payload.empty(), "Empty journal record");
    FLEETCRYPT_CHECK_ARGUMENT(payload.find(FIELD_SEPARATOR) == std::string_view::npos &&
                              payload.find(RECORD_TERMINATOR) == std::string_view::npos,
                              "Journal record contains a separator");

    std::string record;
    record.reserve(payload.size() + CHECKSUM_HEX_LEN + 2);
    record.append(payload);
    record.push_back(FIELD_SEPARATOR);
    record.append(checksum(payload));
    record.push_back(RECORD_TERMINATOR);

    size_t written = 0;
    while (written < record.size()) {
        ssize_t n = ::write(fd_, record.data() + written, record.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_message("write");
            if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
                LOG_ERROR("Could not roll back partial record in ", path_.string(), ": ",
                          std::strerror(errno));
            }
            throw IOError(msg, path_.string(), "Check free disk space");
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd_) != 0) {
        std::string msg = errno_message("fsync");
        if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
            LOG_ERROR("Could not roll back unsynced record in ", path_.string(), ": ",
                      std::strerror(errno));
        }
        throw IOError(msg, path_.string());
    }

    size_ += record.size();
}

void Journal::close() noexcept {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace fleetcrypt
