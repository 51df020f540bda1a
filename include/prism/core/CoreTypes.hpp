#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions and identity helpers for Prism
 *
 * Run identifiers are random UUIDs (Boost.Uuid), timestamps are ISO-8601 UTC
 * with a trailing 'Z'.
 */

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace prism {

// =============================================================================
// Build Mode Detection
// =============================================================================

#ifdef PRISM_DEBUG
constexpr bool kDebugMode = true;
#else
constexpr bool kDebugMode = false;
#endif

// =============================================================================
// Version
// =============================================================================

constexpr int kVersionMajor = 0;
constexpr int kVersionMinor = 3;
constexpr int kVersionPatch = 0;

[[nodiscard]] inline std::string Version() {
    return std::to_string(kVersionMajor) + "." + std::to_string(kVersionMinor) + "." +
           std::to_string(kVersionPatch);
}

// =============================================================================
// Identity
// =============================================================================

/// New random run identifier (UUID v4, canonical lowercase form)
[[nodiscard]] inline std::string NewRunId() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

/// Current time as "YYYY-MM-DDTHH:MM:SS.ffffffZ"
[[nodiscard]] inline std::string UtcTimestamp(
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
    auto t = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) %
              1000000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(6)
        << us.count() << "Z";
    return oss.str();
}

} // namespace prism
