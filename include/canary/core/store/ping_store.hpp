#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>
#include <atomic>

namespace Canary {

/**
 * @brief A single liveness report
 */
struct PingEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @class PingStore
 * @brief Bounded, most-recent-first history of received pings.
 *
 * - record() pushes to the front and evicts from the back once the
 *   history grows past capacity
 * - snapshot() copies the history without mutating it
 * - Readers share the lock, record() holds it exclusively, so an
 *   insert-and-evict is never observed half-applied
 */
class PingStore {
public:
    static constexpr size_t DEFAULT_CAPACITY = 8;

    explicit PingStore(size_t capacity = DEFAULT_CAPACITY);
    ~PingStore() = default;

    PingStore(const PingStore&) = delete;
    PingStore& operator=(const PingStore&) = delete;

    /**
     * @brief Record a ping received now
     * @param reason Free-text reason supplied by the operator (may be empty)
     */
    void record(std::string reason);

    /**
     * @brief Copy of the current history
     * @return Events ordered newest first
     */
    std::vector<PingEvent> snapshot() const;

    size_t size() const;

    size_t capacity() const {
        return capacity_;
    }

    /**
     * @brief Pings ever accepted, evicted ones included
     */
    uint64_t totalRecorded() const {
        return total_recorded_.load(std::memory_order_relaxed);
    }

private:
    const size_t capacity_;
    std::atomic<uint64_t> total_recorded_{0};
    mutable std::shared_mutex mutex_;
    std::deque<PingEvent> pings_;  // front = newest
};

} // namespace Canary
