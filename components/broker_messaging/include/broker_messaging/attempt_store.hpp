#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include "broker_messaging/types.hpp"

namespace broker_messaging {

/**
 * @brief Side table counting deliveries per message id.
 *
 * Redelivery after a requeue does not carry updated headers, so the consumer
 * records each delivery here and adds the count to the x-attempt-count header.
 */
class IAttemptStore {
public:
    virtual ~IAttemptStore() = default;

    /**
     * @brief Record one delivery of the message.
     * @return Deliveries recorded so far, including this one
     */
    virtual Result<int> increment(const std::string& messageId) = 0;

    virtual Result<int> get(const std::string& messageId) = 0;

    // Forget the message once it reached a terminal outcome
    virtual Result<void> clear(const std::string& messageId) = 0;
};

// Process-local store; counts are lost on restart
class InMemoryAttemptStore : public IAttemptStore {
public:
    explicit InMemoryAttemptStore(size_t maxEntries = 100000,
                                  std::chrono::milliseconds ttl = std::chrono::hours(1));

    Result<int> increment(const std::string& messageId) override;
    Result<int> get(const std::string& messageId) override;
    Result<void> clear(const std::string& messageId) override;

    size_t size() const;

private:
    struct Entry {
        std::string messageId;
        int count{0};
        std::chrono::steady_clock::time_point expiresAt;
    };
    using EntryList = std::list<Entry>;

    void evictExpired(std::chrono::steady_clock::time_point now);

    size_t maxEntries_;
    std::chrono::milliseconds ttl_;

    mutable std::mutex mutex_;
    // Most recently touched at the front
    EntryList entries_;
    std::unordered_map<std::string, EntryList::iterator> index_;
};

} // namespace broker_messaging
