#pragma once
#include <canary/core/store/ping_store.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace Canary {

/**
 * @brief Render the HTML status document
 * @param pings History as returned by PingStore::snapshot(), newest first
 * @param capacity Configured history capacity shown in the caption
 * @param now Reference instant for the relative phrases
 */
std::string renderStatusPage(const std::vector<PingEvent>& pings,
                             size_t capacity,
                             std::chrono::system_clock::time_point now);

} // namespace Canary
