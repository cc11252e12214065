#include "fleetcrypt/seen_log.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"

#include <algorithm>
#include <cctype>

namespace fleetcrypt {

namespace {

bool is_valid_fingerprint(const Fingerprint& fingerprint) {
    return !fingerprint.empty() &&
           std::none_of(fingerprint.begin(), fingerprint.end(),
                        [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

} // anonymous namespace

SeenLog::SeenLog(std::filesystem::path journal_path)
    : journal_(std::move(journal_path)) {}

void SeenLog::open() {
    seen_.clear();
    for (auto& fingerprint : journal_.open()) {
        if (!is_valid_fingerprint(fingerprint)) {
            LOG_WARN("Skipping malformed fingerprint in ", path().string());
            continue;
        }
        seen_.insert(std::move(fingerprint));
    }
    LOG_INFO("Seen-message log ", path().string(), ": ", seen_.size(), " messages");
}

void SeenLog::close() noexcept {
    journal_.close();
}

bool SeenLog::contains(const Fingerprint& fingerprint) const {
    return seen_.count(fingerprint) != 0;
}

bool SeenLog::record(const Fingerprint& fingerprint) {
    FLEETCRYPT_CHECK_ARGUMENT(is_valid_fingerprint(fingerprint), "Malformed fingerprint");

    if (contains(fingerprint)) {
        return false;
    }

    journal_.append(fingerprint);
    seen_.insert(fingerprint);
    return true;
}

} // namespace fleetcrypt
