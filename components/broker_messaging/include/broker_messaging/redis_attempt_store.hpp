#pragma once

#include <hiredis/hiredis.h>
#include <chrono>
#include <mutex>
#include <string>
#include "broker_messaging/attempt_store.hpp"

namespace broker_messaging {

/**
 * @brief RAII wrapper for hiredis replies
 */
class RedisReply {
public:
    explicit RedisReply(redisReply* reply) : reply_(reply) {}
    ~RedisReply() { if (reply_) freeReplyObject(reply_); }

    RedisReply(RedisReply&& other) noexcept : reply_(other.reply_) {
        other.reply_ = nullptr;
    }

    RedisReply(const RedisReply&) = delete;
    RedisReply& operator=(const RedisReply&) = delete;

    redisReply* get() const { return reply_; }
    redisReply* operator->() const { return reply_; }
    explicit operator bool() const { return reply_ != nullptr; }

private:
    redisReply* reply_;
};

struct RedisAttemptStoreConfig {
    std::string host{"localhost"};
    int port{6379};
    std::string password;
    std::string keyPrefix{"broker_messaging:attempts:"};
    std::chrono::milliseconds ttl{std::chrono::hours(24)};
    std::chrono::milliseconds connectionTimeout{5000};
    std::chrono::milliseconds socketTimeout{3000};
};

/**
 * @brief Attempt counts kept in Redis so they survive consumer restarts.
 *
 * Counts are INCR'd per message id with a sliding PEXPIRE. The connection is
 * opened lazily and re-opened after an I/O error; failures are reported as
 * ResourceError results so the consumer can fall back to the header count.
 */
class RedisAttemptStore : public IAttemptStore {
public:
    explicit RedisAttemptStore(RedisAttemptStoreConfig config);
    ~RedisAttemptStore() override;

    RedisAttemptStore(const RedisAttemptStore&) = delete;
    RedisAttemptStore& operator=(const RedisAttemptStore&) = delete;

    Result<int> increment(const std::string& messageId) override;
    Result<int> get(const std::string& messageId) override;
    Result<void> clear(const std::string& messageId) override;

    bool isConnected() const;

private:
    // Both require contextMutex_ held
    bool ensureConnected();
    void disconnectLocked();

    Result<int> failure(const std::string& message);
    std::string keyFor(const std::string& messageId) const;

    RedisAttemptStoreConfig config_;

    mutable std::mutex contextMutex_;
    redisContext* context_{nullptr};
};

} // namespace broker_messaging
