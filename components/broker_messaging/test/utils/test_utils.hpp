#pragma once

#include "broker_messaging/config.hpp"
#include "broker_messaging/message.hpp"
#include "broker_messaging/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace broker_messaging {
namespace test {

// Test configuration helpers. Delays are short so retry paths finish quickly.
class TestConfig {
public:
    static RetryPolicy fastRetry(int maxAttempts = 3);
    static ConnectionConfig getTestConnectionConfig();
    static PublisherConfig getTestPublisherConfig();
    static ConsumerConfig getTestConsumerConfig(const std::string& queue = "test-service.queue");
    static DeadLetterConfig getTestDeadLetterConfig(const std::string& queue = "test-service.dlq");
    static MessagingConfig getTestMessagingConfig(const std::string& serviceName = "test-service");

    // Environment variable helpers
    static std::string getEnvVar(const std::string& name, const std::string& defaultValue = "");
};

// Test message creators
class TestMessages {
public:
    static Message createOrderMessage(const std::string& routingKey = "orders.created", int orderId = 1);
    static nlohmann::json createOrderData(int orderId);
};

// Polls the predicate until it holds or the timeout expires
bool waitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = std::chrono::seconds(5),
             std::chrono::milliseconds interval = std::chrono::milliseconds(5));

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string previous_;
    bool hadPrevious_;
};

} // namespace test
} // namespace broker_messaging
