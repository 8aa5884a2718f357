/**
 * @file config.hpp
 * @brief Configuration loading for the messaging layer
 *
 * Configuration comes either from RABBITMQ_* environment variables or from a
 * JSON file. Both paths start from the same defaults and end in validate().
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "broker_messaging/redis_attempt_store.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

enum class AttemptStoreType {
    Memory,
    Redis
};

/**
 * @brief Everything needed to wire one service's messaging runtime
 */
struct MessagingConfig {
    std::string serviceName;
    std::string logLevel{"info"};

    ConnectionConfig connection;
    PublisherConfig publisher;
    ConsumerConfig consumer;
    DeadLetterConfig deadLetter;

    // Applies to each shutdown step separately
    std::chrono::milliseconds shutdownGrace{10000};

    bool enableDeadLetterConsumer{true};

    AttemptStoreType attemptStore{AttemptStoreType::Memory};
    RedisAttemptStoreConfig redis;
};

/**
 * @brief Configuration utilities
 */
class Config {
public:
    /**
     * @brief Defaults for a service: queues are named <service>.queue and <service>.dlq
     * @throws ConfigException if serviceName is empty
     */
    static MessagingConfig defaults(const std::string& serviceName);

    /**
     * @brief Load configuration from RABBITMQ_* environment variables
     * @param serviceName Name used for queue defaults, the connection name and logging
     * @return Validated configuration
     * @throws ConfigException on malformed or invalid values
     */
    static MessagingConfig loadFromEnvironment(const std::string& serviceName);

    /**
     * @brief Load configuration from a JSON file
     * @param filepath Path to JSON configuration file
     * @return Validated configuration
     * @throws ConfigException if the file cannot be opened, parsed or validated
     */
    static MessagingConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Parse configuration from JSON
     *
     * Keys not present keep their defaults. The service name is taken from
     * "serviceName" unless the JSON omits it, in which case fallbackServiceName is used.
     *
     * @throws ConfigException on type errors or invalid values
     */
    static MessagingConfig parseConfig(const nlohmann::json& json,
                                       const std::string& fallbackServiceName = "");

    /**
     * @brief Check invariants across the whole configuration
     * @throws ConfigException describing the first violation found
     */
    static void validate(const MessagingConfig& config);

    static std::string attemptStoreTypeToString(AttemptStoreType type);
    static AttemptStoreType stringToAttemptStoreType(const std::string& value);

private:
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
    static void applyRetry(const nlohmann::json& json, RetryPolicy& retry);
};

} // namespace broker_messaging
