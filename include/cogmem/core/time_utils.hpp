#pragma once

#include <cstdint>
#include <string>

namespace cogmem {

/// Seconds since the Unix epoch, UTC. All engine time is simulated through this type.
using Timestamp = std::int64_t;

constexpr Timestamp kSecondsPerHour = 3600;
constexpr Timestamp kSecondsPerDay = 86400;

/**
 * @brief Current wall-clock time
 */
Timestamp now_utc();

/**
 * @brief Format as ISO-8601 ("2024-01-15T09:30:00Z")
 */
std::string to_iso8601(Timestamp ts);

/**
 * @brief Parse ISO-8601 produced by to_iso8601 (also accepts a space separator)
 *
 * @throws std::invalid_argument on malformed input
 */
Timestamp from_iso8601(const std::string& text);

/**
 * @brief Fractional days between two timestamps (b - a)
 */
double days_between(Timestamp a, Timestamp b);

int hour_of_day(Timestamp ts);

/**
 * @brief Midnight (00:00 UTC) of the day containing ts
 */
Timestamp start_of_day(Timestamp ts);

inline Timestamp days(int n) { return static_cast<Timestamp>(n) * kSecondsPerDay; }
inline Timestamp hours(int n) { return static_cast<Timestamp>(n) * kSecondsPerHour; }

} // namespace cogmem
