#include "test_utils.hpp"
#include <cstdlib>
#include <thread>

namespace broker_messaging {
namespace test {

RetryPolicy TestConfig::fastRetry(int maxAttempts) {
    RetryPolicy retry;
    retry.maxAttempts = maxAttempts;
    retry.initialDelay = std::chrono::milliseconds(5);
    retry.maxDelay = std::chrono::milliseconds(20);
    retry.multiplier = 2.0;
    return retry;
}

ConnectionConfig TestConfig::getTestConnectionConfig() {
    ConnectionConfig config;
    config.host = getEnvVar("RABBITMQ_HOST", "localhost");
    config.port = std::stoi(getEnvVar("RABBITMQ_PORT", "5672"));
    config.vhost = getEnvVar("RABBITMQ_VHOST", "/");
    config.username = getEnvVar("RABBITMQ_USER", "guest");
    config.password = getEnvVar("RABBITMQ_PASS", "guest");
    config.connectionName = "broker_messaging-tests";
    config.heartbeat = std::chrono::seconds(10);
    config.connectionTimeout = std::chrono::seconds(2);
    config.retry = fastRetry();
    return config;
}

PublisherConfig TestConfig::getTestPublisherConfig() {
    PublisherConfig config;
    config.exchange = "events";
    config.confirmTimeout = std::chrono::milliseconds(1000);
    config.sourceService = "test-service";
    return config;
}

ConsumerConfig TestConfig::getTestConsumerConfig(const std::string& queue) {
    ConsumerConfig config;
    config.exchange = "events";
    config.queue = queue;
    config.deadLetterExchange = "events.dlx";
    config.prefetchCount = 10;
    config.concurrentConsumers = 3;
    config.retry = fastRetry();
    config.pollInterval = std::chrono::milliseconds(10);
    return config;
}

DeadLetterConfig TestConfig::getTestDeadLetterConfig(const std::string& queue) {
    DeadLetterConfig config;
    config.deadLetterExchange = "events.dlx";
    config.queue = queue;
    config.exchange = "events";
    config.republishDelay = std::chrono::milliseconds(10);
    config.pollInterval = std::chrono::milliseconds(10);
    return config;
}

MessagingConfig TestConfig::getTestMessagingConfig(const std::string& serviceName) {
    MessagingConfig config = Config::defaults(serviceName);
    config.connection.retry = fastRetry();
    config.publisher.confirmTimeout = std::chrono::milliseconds(1000);
    config.consumer.retry = fastRetry();
    config.consumer.pollInterval = std::chrono::milliseconds(10);
    config.deadLetter.pollInterval = std::chrono::milliseconds(10);
    config.deadLetter.republishDelay = std::chrono::milliseconds(10);
    config.shutdownGrace = std::chrono::milliseconds(2000);
    return config;
}

std::string TestConfig::getEnvVar(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

Message TestMessages::createOrderMessage(const std::string& routingKey, int orderId) {
    return Message::fromJson(routingKey, createOrderData(orderId));
}

nlohmann::json TestMessages::createOrderData(int orderId) {
    return {
        {"orderId", orderId},
        {"customer", "customer-" + std::to_string(orderId)},
        {"total", 19.99 * orderId}
    };
}

bool waitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout,
             std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(interval);
    }
    return predicate();
}

ScopedEnv::ScopedEnv(const std::string& name, const std::string& value)
    : name_(name), hadPrevious_(false) {
    if (const char* previous = std::getenv(name.c_str())) {
        previous_ = previous;
        hadPrevious_ = true;
    }
    setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv() {
    if (hadPrevious_) {
        setenv(name_.c_str(), previous_.c_str(), 1);
    } else {
        unsetenv(name_.c_str());
    }
}

} // namespace test
} // namespace broker_messaging
