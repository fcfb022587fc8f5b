#pragma once

#include <ctime>
#include <string>

#include "util/Expected.hpp"

namespace gitv {

/**
 * @brief Loosely typed commit record as a history source hands it over
 *
 * `date` is either git's raw "<epoch-seconds> <tz>" form or an ISO 8601
 * date ("2024-03-01", "2024-03-01T14:30:00", "2024-03-01 14:30:00 +0200").
 */
struct RawCommitRecord {
    std::string authorEmail;
    std::string date;
};

/// Validated commit event: who and when (absolute instant)
struct CommitEvent {
    std::string authorEmail;
    std::time_t timestamp{0};
};

/**
 * @brief Validate a raw record into a CommitEvent
 * @return InvalidTimestamp if the date cannot be parsed; records are never coerced
 */
Expected<CommitEvent> normalizeCommitRecord(const RawCommitRecord& raw);

/**
 * @brief Parse a date string into an absolute instant
 *
 * ISO dates without a UTC offset are interpreted in the local timezone.
 */
Expected<std::time_t> parseCommitDate(const std::string& text);

}
