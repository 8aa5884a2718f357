#include "broker_messaging/attempt_store.hpp"
#include <spdlog/spdlog.h>

namespace broker_messaging {

InMemoryAttemptStore::InMemoryAttemptStore(size_t maxEntries, std::chrono::milliseconds ttl)
    : maxEntries_(maxEntries), ttl_(ttl) {
    if (maxEntries_ == 0) {
        throw ConfigException("Attempt store max entries must be greater than 0");
    }
    spdlog::debug("InMemoryAttemptStore created with max entries: {}, TTL: {}ms",
                  maxEntries_, ttl_.count());
}

Result<int> InMemoryAttemptStore::increment(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    evictExpired(now);

    auto it = index_.find(messageId);
    if (it != index_.end()) {
        entries_.splice(entries_.begin(), entries_, it->second);
        Entry& entry = entries_.front();
        entry.count += 1;
        entry.expiresAt = now + ttl_;
        return Result<int>(entry.count);
    }

    if (entries_.size() >= maxEntries_) {
        index_.erase(entries_.back().messageId);
        entries_.pop_back();
    }

    entries_.push_front(Entry{messageId, 1, now + ttl_});
    index_[messageId] = entries_.begin();
    return Result<int>(1);
}

Result<int> InMemoryAttemptStore::get(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictExpired(std::chrono::steady_clock::now());

    auto it = index_.find(messageId);
    return Result<int>(it == index_.end() ? 0 : it->second->count);
}

Result<void> InMemoryAttemptStore::clear(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(messageId);
    if (it != index_.end()) {
        entries_.erase(it->second);
        index_.erase(it);
    }
    return Result<void>();
}

size_t InMemoryAttemptStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryAttemptStore::evictExpired(std::chrono::steady_clock::time_point now) {
    // Expiry order follows touch order, so expired entries sit at the back
    while (!entries_.empty() && entries_.back().expiresAt <= now) {
        index_.erase(entries_.back().messageId);
        entries_.pop_back();
    }
}

} // namespace broker_messaging
