#include <canary/core/store/ping_store.hpp>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace Canary {

PingStore::PingStore(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("PingStore capacity must be at least 1");
    }
    spdlog::debug("[PingStore] Initialized (capacity: {})", capacity_);
}

void PingStore::record(std::string reason) {
    {
        // Stamp under the lock so timestamps follow insertion order
        std::unique_lock lock(mutex_);
        pings_.push_front(PingEvent{std::move(reason), std::chrono::system_clock::now()});
        while (pings_.size() > capacity_) {
            pings_.pop_back();
        }
    }

    total_recorded_.fetch_add(1, std::memory_order_relaxed);
}

std::vector<PingEvent> PingStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return std::vector<PingEvent>(pings_.begin(), pings_.end());
}

size_t PingStore::size() const {
    std::shared_lock lock(mutex_);
    return pings_.size();
}

} // namespace Canary
