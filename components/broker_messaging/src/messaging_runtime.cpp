// src/messaging_runtime.cpp
#include "broker_messaging/messaging_runtime.hpp"
#include "broker_messaging/amqp_broker.hpp"
#include "broker_messaging/redis_attempt_store.hpp"
#include <spdlog/spdlog.h>

namespace broker_messaging {

MessagingRuntime::MessagingRuntime(MessagingConfig config)
    : MessagingRuntime(std::move(config), std::make_shared<AmqpConnectionFactory>()) {
}

MessagingRuntime::MessagingRuntime(MessagingConfig config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)) {
    Config::validate(config_);

    connectionManager_ = std::make_shared<ConnectionManager>(config_.connection, std::move(factory));
    publisher_ = std::make_shared<Publisher>(connectionManager_, config_.publisher);
    attemptStore_ = createAttemptStore();

    if (config_.enableDeadLetterConsumer) {
        std::shared_ptr<Publisher> republisher;
        if (config_.deadLetter.republish) {
            republisher = publisher_;
        }
        deadLetterConsumer_ = std::make_shared<DeadLetterConsumer>(connectionManager_, config_.deadLetter, republisher);
    }

    auto forward = [this](const std::string& code, const std::string& message, const std::string& context) {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = errorCallback_;
        }
        if (callback) {
            callback(code, message, context);
        }
    };
    connectionManager_->setErrorCallback(forward);
    publisher_->setErrorCallback(forward);
    if (deadLetterConsumer_) {
        deadLetterConsumer_->setErrorCallback(forward);
    }
}

MessagingRuntime::~MessagingRuntime() {
    shutdown();
}

void MessagingRuntime::start() {
    if (shutdown_) {
        throw SetupException("Messaging runtime has been shut down");
    }
    if (started_.exchange(true)) {
        return;
    }

    spdlog::info("Starting messaging for service '{}' ({}:{}{})", config_.serviceName,
                 config_.connection.host, config_.connection.port, config_.connection.vhost);

    try {
        connectionManager_->getConnection();

        auto initialized = publisher_->initialize();
        if (!initialized) {
            throw SetupException("Publisher initialization failed: " + initialized.message);
        }

        if (deadLetterConsumer_) {
            deadLetterConsumer_->start();
        }
    } catch (const MessagingException& e) {
        spdlog::error("Messaging startup failed: {}", e.what());
        started_ = false;
        throw;
    }

    spdlog::info("Messaging for service '{}' started", config_.serviceName);
}

std::shared_ptr<Consumer> MessagingRuntime::addConsumer(const std::vector<std::string>& routingKeys,
                                                        MessageHandler handler) {
    return addConsumer(config_.consumer, routingKeys, std::move(handler));
}

std::shared_ptr<Consumer> MessagingRuntime::addConsumer(const ConsumerConfig& consumerConfig,
                                                        const std::vector<std::string>& routingKeys,
                                                        MessageHandler handler) {
    if (!started_ || shutdown_) {
        throw SetupException("Messaging runtime is not running");
    }
    if (routingKeys.empty()) {
        throw SetupException("A consumer needs at least one routing key");
    }

    auto consumer = std::make_shared<Consumer>(connectionManager_, consumerConfig, attemptStore_);
    consumer->setErrorCallback([this](const std::string& code, const std::string& message,
                                      const std::string& context) {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = errorCallback_;
        }
        if (callback) {
            callback(code, message, context);
        }
    });
    consumer->startConsuming(routingKeys, std::move(handler));

    std::lock_guard<std::mutex> lock(consumersMutex_);
    consumers_.push_back(consumer);
    return consumer;
}

void MessagingRuntime::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    spdlog::info("Shutting down messaging for service '{}'", config_.serviceName);

    std::vector<std::shared_ptr<Consumer>> consumers;
    {
        std::lock_guard<std::mutex> lock(consumersMutex_);
        consumers.swap(consumers_);
    }
    for (auto& consumer : consumers) {
        consumer->stopConsuming(config_.shutdownGrace);
    }

    if (deadLetterConsumer_) {
        deadLetterConsumer_->stop(config_.shutdownGrace);
    }

    publisher_->close();
    connectionManager_->close();
    started_ = false;

    spdlog::info("Messaging for service '{}' shut down", config_.serviceName);
}

bool MessagingRuntime::isHealthy() const {
    if (!started_ || shutdown_) {
        return false;
    }
    if (deadLetterConsumer_ && !deadLetterConsumer_->isHealthy()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(consumersMutex_);
    for (const auto& consumer : consumers_) {
        if (!consumer->isHealthy()) {
            return false;
        }
    }
    return true;
}

Publisher& MessagingRuntime::publisher() {
    return *publisher_;
}

void MessagingRuntime::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

std::shared_ptr<IAttemptStore> MessagingRuntime::createAttemptStore() const {
    if (config_.attemptStore == AttemptStoreType::Redis) {
        spdlog::info("Using Redis attempt store at {}:{}", config_.redis.host, config_.redis.port);
        return std::make_shared<RedisAttemptStore>(config_.redis);
    }
    return std::make_shared<InMemoryAttemptStore>();
}

} // namespace broker_messaging
