#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Constants used throughout gitv
 *
 * Centralizes magic numbers of the calendar and of the git on-disk format.
 */
namespace gitv {

namespace Constants {
    // Rolling window
    constexpr int DAYS_IN_WINDOW = 183;           // ~six months of history
    constexpr int WEEKS_IN_WINDOW = 26;
    constexpr int OUT_OF_RANGE = 99999;           // daysSince() sentinel, never a map key
    constexpr int DAYS_PER_WEEK = 7;
    constexpr int64_t SECONDS_PER_DAY = 86400;

    // Contribution levels (inclusive upper bounds)
    constexpr int LEVEL_NONE_MAX = 0;
    constexpr int LEVEL_LOW_MAX = 3;
    constexpr int LEVEL_MEDIUM_MAX = 6;
    constexpr int LEVEL_HIGH_MAX = 9;

    // Registry and scanning
    constexpr const char* REGISTRY_FILE_NAME = ".gogitlocalstats";
    constexpr const char* REPOSITORY_MARKER = ".git";
    constexpr const char* DEFAULT_IGNORED_DIRS[] = {"node_modules", "vendor"};

    // Git object storage
    constexpr size_t SHA1_HEX_LENGTH = 40;
    constexpr size_t SHA1_RAW_LENGTH = 20;
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // objects/<aa>/<rest>
    constexpr int MAX_SYMREF_DEPTH = 5;
    constexpr int MAX_DELTA_DEPTH = 1000;
    constexpr uint64_t MAX_OBJECT_SIZE = 1ull << 30;  // inflated bytes accepted per object
}
}
