#pragma once

#include <chrono>
#include <string>

namespace Canary {

/**
 * @brief Rough human phrase for the gap between two instants
 *
 * Buckets mirror what people say out loud: "now", "seconds ago",
 * "a minute ago", "5 minutes ago", "an hour ago", ... "3 years ago".
 * Instants after @p reference read "in 5 minutes".
 *
 * @param when Instant being described
 * @param reference Instant treated as "now"
 */
std::string humanizeSince(std::chrono::system_clock::time_point when,
                          std::chrono::system_clock::time_point reference);

/**
 * @brief ISO-8601 UTC rendering with millisecond precision
 * @return e.g. "2024-05-01T12:00:00.000Z"
 */
std::string formatUtcTimestamp(std::chrono::system_clock::time_point when);

} // namespace Canary
