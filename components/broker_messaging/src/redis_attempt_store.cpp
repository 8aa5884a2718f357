// src/redis_attempt_store.cpp
#include "broker_messaging/redis_attempt_store.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace broker_messaging {

namespace {

timeval toTimeval(std::chrono::milliseconds duration) {
    timeval tv;
    tv.tv_sec = static_cast<long>(duration.count() / 1000);
    tv.tv_usec = static_cast<long>((duration.count() % 1000) * 1000);
    return tv;
}

bool isErrorReply(const redisReply* reply) {
    return reply && reply->type == REDIS_REPLY_ERROR;
}

} // namespace

RedisAttemptStore::RedisAttemptStore(RedisAttemptStoreConfig config)
    : config_(std::move(config)) {
    spdlog::debug("RedisAttemptStore created for {}:{}", config_.host, config_.port);
}

RedisAttemptStore::~RedisAttemptStore() {
    std::lock_guard<std::mutex> lock(contextMutex_);
    disconnectLocked();
}

Result<int> RedisAttemptStore::increment(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(contextMutex_);
    if (!ensureConnected()) {
        return failure("Not connected to Redis");
    }

    const std::string key = keyFor(messageId);

    // INCR and PEXPIRE pipelined in one round trip
    redisAppendCommand(context_, "INCR %s", key.c_str());
    redisAppendCommand(context_, "PEXPIRE %s %lld", key.c_str(),
                       static_cast<long long>(config_.ttl.count()));

    redisReply* raw = nullptr;
    if (redisGetReply(context_, reinterpret_cast<void**>(&raw)) != REDIS_OK) {
        return failure("INCR failed: " + std::string(context_->errstr));
    }
    RedisReply incr(raw);

    raw = nullptr;
    if (redisGetReply(context_, reinterpret_cast<void**>(&raw)) != REDIS_OK) {
        return failure("PEXPIRE failed: " + std::string(context_->errstr));
    }
    RedisReply expire(raw);

    if (!incr || isErrorReply(incr.get()) || incr->type != REDIS_REPLY_INTEGER) {
        return Result<int>(ErrorType::ResourceError,
                           "Redis error on INCR: " + std::string(incr && incr->str ? incr->str : "unexpected reply"));
    }
    if (isErrorReply(expire.get())) {
        spdlog::warn("Redis PEXPIRE failed for {}: {}", key, expire->str ? expire->str : "unknown error");
    }

    return Result<int>(static_cast<int>(incr->integer));
}

Result<int> RedisAttemptStore::get(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(contextMutex_);
    if (!ensureConnected()) {
        return failure("Not connected to Redis");
    }

    RedisReply reply(static_cast<redisReply*>(
        redisCommand(context_, "GET %s", keyFor(messageId).c_str())));
    if (!reply) {
        return failure("GET failed: " + std::string(context_->errstr));
    }
    if (isErrorReply(reply.get())) {
        return Result<int>(ErrorType::ResourceError,
                           "Redis error on GET: " + std::string(reply->str ? reply->str : ""));
    }
    if (reply->type == REDIS_REPLY_NIL || !reply->str) {
        return Result<int>(0);
    }
    return Result<int>(std::atoi(reply->str));
}

Result<void> RedisAttemptStore::clear(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(contextMutex_);
    if (!ensureConnected()) {
        return Result<void>(ErrorType::ResourceError, "Not connected to Redis");
    }

    RedisReply reply(static_cast<redisReply*>(
        redisCommand(context_, "DEL %s", keyFor(messageId).c_str())));
    if (!reply) {
        std::string error = "DEL failed: " + std::string(context_->errstr);
        disconnectLocked();
        return Result<void>(ErrorType::ResourceError, error);
    }
    if (isErrorReply(reply.get())) {
        return Result<void>(ErrorType::ResourceError,
                            "Redis error on DEL: " + std::string(reply->str ? reply->str : ""));
    }
    return Result<void>();
}

bool RedisAttemptStore::isConnected() const {
    std::lock_guard<std::mutex> lock(contextMutex_);
    return context_ != nullptr;
}

bool RedisAttemptStore::ensureConnected() {
    if (context_) {
        return true;
    }

    timeval timeout = toTimeval(config_.connectionTimeout);
    context_ = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);
    if (!context_) {
        spdlog::error("Failed to allocate Redis context");
        return false;
    }
    if (context_->err) {
        spdlog::error("Redis connection to {}:{} failed: {}", config_.host, config_.port, context_->errstr);
        disconnectLocked();
        return false;
    }

    timeval socketTimeout = toTimeval(config_.socketTimeout);
    if (redisSetTimeout(context_, socketTimeout) != REDIS_OK) {
        spdlog::warn("Failed to set socket timeout for Redis connection");
    }

    if (!config_.password.empty()) {
        RedisReply reply(static_cast<redisReply*>(
            redisCommand(context_, "AUTH %s", config_.password.c_str())));
        if (!reply || isErrorReply(reply.get())) {
            spdlog::error("Redis authentication failed: {}",
                          reply && reply->str ? reply->str : context_->errstr);
            disconnectLocked();
            return false;
        }
    }

    spdlog::info("Attempt store connected to Redis at {}:{}", config_.host, config_.port);
    return true;
}

void RedisAttemptStore::disconnectLocked() {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
}

Result<int> RedisAttemptStore::failure(const std::string& message) {
    spdlog::warn("Redis attempt store: {}", message);
    // Drop the context so the next call reconnects
    disconnectLocked();
    return Result<int>(ErrorType::ResourceError, message);
}

std::string RedisAttemptStore::keyFor(const std::string& messageId) const {
    return config_.keyPrefix + messageId;
}

} // namespace broker_messaging
