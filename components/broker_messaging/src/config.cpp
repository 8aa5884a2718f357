/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "broker_messaging/config.hpp"
#include <boost/program_options.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace po = boost::program_options;

namespace broker_messaging {

namespace {

constexpr const char* kEnvironmentPrefix = "RABBITMQ_";

po::options_description environmentOptions() {
    po::options_description desc("Messaging environment");
    desc.add_options()
        ("host", po::value<std::string>(), "Broker host")
        ("port", po::value<int>(), "Broker port")
        ("vhost", po::value<std::string>(), "Virtual host")
        ("user", po::value<std::string>(), "Username")
        ("pass", po::value<std::string>(), "Password")
        ("exchange", po::value<std::string>(), "Primary exchange")
        ("exchange_type", po::value<std::string>(), "Primary exchange type")
        ("dlq_exchange", po::value<std::string>(), "Dead-letter exchange")
        ("queue", po::value<std::string>(), "Work queue")
        ("dlq_queue", po::value<std::string>(), "Dead-letter queue")
        ("message_ttl", po::value<int64_t>(), "Work queue message TTL in ms")
        ("retry_count", po::value<int>(), "Maximum attempts")
        ("initial_retry_interval", po::value<int64_t>(), "First backoff delay in ms")
        ("max_retry_interval", po::value<int64_t>(), "Backoff ceiling in ms")
        ("retry_multiplier", po::value<double>(), "Backoff multiplier")
        ("prefetch_count", po::value<int>(), "Unacknowledged delivery limit")
        ("publish_confirm_timeout", po::value<int64_t>(), "Publish confirm timeout in ms")
        ("concurrent_consumers", po::value<int>(), "Consumer worker count")
        ("heartbeat", po::value<int>(), "Heartbeat in seconds")
        ("connection_timeout", po::value<int64_t>(), "Connect timeout in ms")
        ("shutdown_grace", po::value<int64_t>(), "Shutdown grace period in ms")
        ("dlq_enabled", po::value<bool>(), "Run the dead-letter consumer")
        ("dlq_republish", po::value<bool>(), "Republish dead letters")
        ("dlq_republish_delay", po::value<int64_t>(), "Delay before republishing in ms")
        ("dlq_max_republish", po::value<int>(), "Republish ceiling")
        ("attempt_store", po::value<std::string>(), "memory or redis")
        ("redis_host", po::value<std::string>(), "Attempt store Redis host")
        ("redis_port", po::value<int>(), "Attempt store Redis port")
        ("redis_password", po::value<std::string>(), "Attempt store Redis password")
        ("log_level", po::value<std::string>(), "Log level");
    return desc;
}

template <typename T>
bool lookup(const po::variables_map& vm, const char* name, T& out) {
    if (!vm.count(name)) {
        return false;
    }
    out = vm[name].as<T>();
    return true;
}

uint16_t toPrefetch(int value) {
    if (value <= 0 || value > 65535) {
        throw ConfigException("Prefetch count must be between 1 and 65535, got " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

// Single retry value shared by connection establishment and redelivery
void setRetry(MessagingConfig& config, const RetryPolicy& retry) {
    config.connection.retry = retry;
    config.consumer.retry = retry;
}

} // namespace

MessagingConfig Config::defaults(const std::string& serviceName) {
    if (serviceName.empty()) {
        throw ConfigException("Service name must not be empty");
    }

    MessagingConfig config;
    config.serviceName = serviceName;
    config.connection.connectionName = serviceName;
    config.publisher.sourceService = serviceName;
    config.consumer.queue = serviceName + ".queue";
    config.deadLetter.queue = serviceName + ".dlq";
    config.deadLetter.deadLetterExchange = config.consumer.deadLetterExchange;
    config.deadLetter.exchange = config.publisher.exchange;
    return config;
}

MessagingConfig Config::loadFromEnvironment(const std::string& serviceName) {
    MessagingConfig config = defaults(serviceName);
    const auto desc = environmentOptions();

    // Unknown RABBITMQ_* variables are skipped rather than rejected
    auto mapper = [&desc](const std::string& variable) -> std::string {
        const std::string prefix(kEnvironmentPrefix);
        if (variable.compare(0, prefix.size(), prefix) != 0) {
            return "";
        }
        std::string name = variable.substr(prefix.size());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return desc.find_nothrow(name, false) ? name : "";
    };

    po::variables_map vm;
    try {
        po::store(po::parse_environment(desc, mapper), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigException(std::string("Invalid messaging environment: ") + e.what());
    }

    lookup(vm, "host", config.connection.host);
    lookup(vm, "port", config.connection.port);
    lookup(vm, "vhost", config.connection.vhost);
    lookup(vm, "user", config.connection.username);
    lookup(vm, "pass", config.connection.password);

    std::string exchange;
    if (lookup(vm, "exchange", exchange)) {
        config.publisher.exchange = exchange;
        config.consumer.exchange = exchange;
        config.deadLetter.exchange = exchange;
    }
    std::string exchangeType;
    if (lookup(vm, "exchange_type", exchangeType)) {
        config.publisher.exchangeType = stringToExchangeType(exchangeType);
        config.consumer.exchangeType = config.publisher.exchangeType;
    }
    std::string dlx;
    if (lookup(vm, "dlq_exchange", dlx)) {
        config.consumer.deadLetterExchange = dlx;
        config.deadLetter.deadLetterExchange = dlx;
    }
    lookup(vm, "queue", config.consumer.queue);
    lookup(vm, "dlq_queue", config.deadLetter.queue);

    int64_t millis = 0;
    if (lookup(vm, "message_ttl", millis)) {
        config.consumer.messageTtl = std::chrono::milliseconds(millis);
    }

    RetryPolicy retry = config.connection.retry;
    lookup(vm, "retry_count", retry.maxAttempts);
    if (lookup(vm, "initial_retry_interval", millis)) {
        retry.initialDelay = std::chrono::milliseconds(millis);
    }
    if (lookup(vm, "max_retry_interval", millis)) {
        retry.maxDelay = std::chrono::milliseconds(millis);
    }
    lookup(vm, "retry_multiplier", retry.multiplier);
    setRetry(config, retry);

    int number = 0;
    if (lookup(vm, "prefetch_count", number)) {
        config.consumer.prefetchCount = toPrefetch(number);
        config.deadLetter.prefetchCount = config.consumer.prefetchCount;
    }
    if (lookup(vm, "publish_confirm_timeout", millis)) {
        config.publisher.confirmTimeout = std::chrono::milliseconds(millis);
    }
    lookup(vm, "concurrent_consumers", config.consumer.concurrentConsumers);
    if (lookup(vm, "heartbeat", number)) {
        config.connection.heartbeat = std::chrono::seconds(number);
    }
    if (lookup(vm, "connection_timeout", millis)) {
        config.connection.connectionTimeout = std::chrono::milliseconds(millis);
    }
    if (lookup(vm, "shutdown_grace", millis)) {
        config.shutdownGrace = std::chrono::milliseconds(millis);
    }

    lookup(vm, "dlq_enabled", config.enableDeadLetterConsumer);
    lookup(vm, "dlq_republish", config.deadLetter.republish);
    if (lookup(vm, "dlq_republish_delay", millis)) {
        config.deadLetter.republishDelay = std::chrono::milliseconds(millis);
    }
    lookup(vm, "dlq_max_republish", config.deadLetter.maxRepublishAttempts);

    std::string store;
    if (lookup(vm, "attempt_store", store)) {
        config.attemptStore = stringToAttemptStoreType(store);
    }
    lookup(vm, "redis_host", config.redis.host);
    lookup(vm, "redis_port", config.redis.port);
    lookup(vm, "redis_password", config.redis.password);
    lookup(vm, "log_level", config.logLevel);

    validate(config);
    spdlog::debug("Loaded messaging configuration for '{}' from environment", serviceName);
    return config;
}

MessagingConfig Config::loadFromFile(const std::string& filepath) {
    return parseConfig(loadJsonFromFile(filepath));
}

MessagingConfig Config::parseConfig(const nlohmann::json& json, const std::string& fallbackServiceName) {
    MessagingConfig config;
    try {
        std::string serviceName = json.value("serviceName", fallbackServiceName);
        config = defaults(serviceName);

        if (json.contains("logLevel")) {
            config.logLevel = json["logLevel"].get<std::string>();
        }
        if (json.contains("shutdownGraceMs")) {
            config.shutdownGrace = std::chrono::milliseconds(json["shutdownGraceMs"].get<int64_t>());
        }

        if (json.contains("connection")) {
            const auto& connectionJson = json["connection"];
            auto& connection = config.connection;

            if (connectionJson.contains("host")) {
                connection.host = connectionJson["host"].get<std::string>();
            }
            if (connectionJson.contains("port")) {
                connection.port = connectionJson["port"].get<int>();
            }
            if (connectionJson.contains("vhost")) {
                connection.vhost = connectionJson["vhost"].get<std::string>();
            }
            if (connectionJson.contains("username")) {
                connection.username = connectionJson["username"].get<std::string>();
            }
            if (connectionJson.contains("password")) {
                connection.password = connectionJson["password"].get<std::string>();
            }
            if (connectionJson.contains("connectionName")) {
                connection.connectionName = connectionJson["connectionName"].get<std::string>();
            }
            if (connectionJson.contains("heartbeatSeconds")) {
                connection.heartbeat = std::chrono::seconds(connectionJson["heartbeatSeconds"].get<int>());
            }
            if (connectionJson.contains("connectionTimeoutMs")) {
                connection.connectionTimeout =
                    std::chrono::milliseconds(connectionJson["connectionTimeoutMs"].get<int64_t>());
            }
        }

        if (json.contains("retry")) {
            RetryPolicy retry = config.connection.retry;
            applyRetry(json["retry"], retry);
            setRetry(config, retry);
        }

        if (json.contains("exchange")) {
            const auto& exchangeJson = json["exchange"];
            if (exchangeJson.contains("name")) {
                std::string name = exchangeJson["name"].get<std::string>();
                config.publisher.exchange = name;
                config.consumer.exchange = name;
                config.deadLetter.exchange = name;
            }
            if (exchangeJson.contains("type")) {
                config.publisher.exchangeType = stringToExchangeType(exchangeJson["type"].get<std::string>());
                config.consumer.exchangeType = config.publisher.exchangeType;
            }
            if (exchangeJson.contains("declare")) {
                config.publisher.declareExchange = exchangeJson["declare"].get<bool>();
                config.consumer.declareExchange = config.publisher.declareExchange;
            }
            if (exchangeJson.contains("deadLetter")) {
                std::string dlx = exchangeJson["deadLetter"].get<std::string>();
                config.consumer.deadLetterExchange = dlx;
                config.deadLetter.deadLetterExchange = dlx;
            }
        }

        if (json.contains("publisher")) {
            const auto& publisherJson = json["publisher"];
            if (publisherJson.contains("confirmTimeoutMs")) {
                config.publisher.confirmTimeout =
                    std::chrono::milliseconds(publisherJson["confirmTimeoutMs"].get<int64_t>());
            }
            if (publisherJson.contains("persistent")) {
                config.publisher.persistentMessages = publisherJson["persistent"].get<bool>();
            }
        }

        if (json.contains("consumer")) {
            const auto& consumerJson = json["consumer"];
            if (consumerJson.contains("queue")) {
                config.consumer.queue = consumerJson["queue"].get<std::string>();
            }
            if (consumerJson.contains("messageTtlMs")) {
                config.consumer.messageTtl = std::chrono::milliseconds(consumerJson["messageTtlMs"].get<int64_t>());
            }
            if (consumerJson.contains("prefetchCount")) {
                config.consumer.prefetchCount = toPrefetch(consumerJson["prefetchCount"].get<int>());
                config.deadLetter.prefetchCount = config.consumer.prefetchCount;
            }
            if (consumerJson.contains("concurrentConsumers")) {
                config.consumer.concurrentConsumers = consumerJson["concurrentConsumers"].get<int>();
            }
            if (consumerJson.contains("consumerTag")) {
                config.consumer.consumerTag = consumerJson["consumerTag"].get<std::string>();
            }
        }

        if (json.contains("deadLetter")) {
            const auto& dlqJson = json["deadLetter"];
            if (dlqJson.contains("enabled")) {
                config.enableDeadLetterConsumer = dlqJson["enabled"].get<bool>();
            }
            if (dlqJson.contains("queue")) {
                config.deadLetter.queue = dlqJson["queue"].get<std::string>();
            }
            if (dlqJson.contains("republish")) {
                config.deadLetter.republish = dlqJson["republish"].get<bool>();
            }
            if (dlqJson.contains("republishDelayMs")) {
                config.deadLetter.republishDelay =
                    std::chrono::milliseconds(dlqJson["republishDelayMs"].get<int64_t>());
            }
            if (dlqJson.contains("maxRepublishAttempts")) {
                config.deadLetter.maxRepublishAttempts = dlqJson["maxRepublishAttempts"].get<int>();
            }
        }

        if (json.contains("attemptStore")) {
            const auto& storeJson = json["attemptStore"];
            if (storeJson.contains("type")) {
                config.attemptStore = stringToAttemptStoreType(storeJson["type"].get<std::string>());
            }
            if (storeJson.contains("redis")) {
                const auto& redisJson = storeJson["redis"];
                if (redisJson.contains("host")) {
                    config.redis.host = redisJson["host"].get<std::string>();
                }
                if (redisJson.contains("port")) {
                    config.redis.port = redisJson["port"].get<int>();
                }
                if (redisJson.contains("password")) {
                    config.redis.password = redisJson["password"].get<std::string>();
                }
                if (redisJson.contains("keyPrefix")) {
                    config.redis.keyPrefix = redisJson["keyPrefix"].get<std::string>();
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException(std::string("Invalid configuration value: ") + e.what());
    }

    validate(config);
    return config;
}

void Config::validate(const MessagingConfig& config) {
    if (config.serviceName.empty()) {
        throw ConfigException("Service name must not be empty");
    }
    if (config.connection.host.empty()) {
        throw ConfigException("Broker host must not be empty");
    }
    if (config.connection.port < 1 || config.connection.port > 65535) {
        throw ConfigException("Broker port must be between 1 and 65535, got " +
                              std::to_string(config.connection.port));
    }
    if (config.connection.heartbeat.count() < 0) {
        throw ConfigException("Heartbeat must not be negative");
    }
    if (config.publisher.exchange.empty() || config.consumer.exchange.empty()) {
        throw ConfigException("Exchange name must not be empty");
    }
    if (config.publisher.confirmTimeout.count() <= 0) {
        throw ConfigException("Publish confirm timeout must be positive");
    }
    if (config.consumer.queue.empty()) {
        throw ConfigException("Consumer queue name must not be empty");
    }
    if (config.consumer.prefetchCount == 0) {
        throw ConfigException("Prefetch count must be greater than 0");
    }
    if (config.consumer.concurrentConsumers <= 0) {
        throw ConfigException("Concurrent consumers must be greater than 0");
    }
    if (config.consumer.messageTtl.count() < 0) {
        throw ConfigException("Message TTL must not be negative");
    }
    if (config.consumer.messageTtl.count() > std::numeric_limits<int32_t>::max()) {
        throw ConfigException("Message TTL " + std::to_string(config.consumer.messageTtl.count()) +
                              "ms exceeds the broker limit of " +
                              std::to_string(std::numeric_limits<int32_t>::max()) + "ms");
    }

    for (const RetryPolicy* retry : {&config.connection.retry, &config.consumer.retry}) {
        if (retry->maxAttempts < 1) {
            throw ConfigException("Retry count must be at least 1");
        }
        if (retry->initialDelay.count() < 0) {
            throw ConfigException("Initial retry interval must not be negative");
        }
        if (retry->initialDelay > retry->maxDelay) {
            throw ConfigException("Initial retry interval " + std::to_string(retry->initialDelay.count()) +
                                  "ms exceeds maximum " + std::to_string(retry->maxDelay.count()) + "ms");
        }
        if (retry->multiplier < 1.0) {
            throw ConfigException("Retry multiplier must be at least 1");
        }
    }

    if (config.enableDeadLetterConsumer) {
        if (config.deadLetter.queue.empty() || config.deadLetter.deadLetterExchange.empty()) {
            throw ConfigException("Dead-letter queue and exchange must be set when the dead-letter consumer is enabled");
        }
        if (config.deadLetter.maxRepublishAttempts < 0) {
            throw ConfigException("Max republish attempts must not be negative");
        }
        if (config.deadLetter.republishDelay.count() < 0) {
            throw ConfigException("Republish delay must not be negative");
        }
    }

    if (config.attemptStore == AttemptStoreType::Redis) {
        if (config.redis.host.empty()) {
            throw ConfigException("Redis host must be set for the redis attempt store");
        }
        if (config.redis.port < 1 || config.redis.port > 65535) {
            throw ConfigException("Redis port must be between 1 and 65535");
        }
    }
}

std::string Config::attemptStoreTypeToString(AttemptStoreType type) {
    switch (type) {
        case AttemptStoreType::Memory: return "memory";
        case AttemptStoreType::Redis: return "redis";
        default: return "unknown";
    }
}

AttemptStoreType Config::stringToAttemptStoreType(const std::string& value) {
    if (value == "memory") return AttemptStoreType::Memory;
    if (value == "redis") return AttemptStoreType::Redis;
    throw ConfigException("Unknown attempt store '" + value + "', expected memory or redis");
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigException("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Failed to parse configuration file: " + std::string(e.what()));
    }
}

void Config::applyRetry(const nlohmann::json& json, RetryPolicy& retry) {
    if (json.contains("maxAttempts")) {
        retry.maxAttempts = json["maxAttempts"].get<int>();
    }
    if (json.contains("initialDelayMs")) {
        retry.initialDelay = std::chrono::milliseconds(json["initialDelayMs"].get<int64_t>());
    }
    if (json.contains("maxDelayMs")) {
        retry.maxDelay = std::chrono::milliseconds(json["maxDelayMs"].get<int64_t>());
    }
    if (json.contains("multiplier")) {
        retry.multiplier = json["multiplier"].get<double>();
    }
}

} // namespace broker_messaging
