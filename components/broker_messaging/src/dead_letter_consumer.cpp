// src/dead_letter_consumer.cpp
#include "broker_messaging/dead_letter_consumer.hpp"
#include "broker_messaging/backoff.hpp"
#include "broker_messaging/topology.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace broker_messaging {

DeathInfo parseDeathHeader(const Message& message) {
    DeathInfo info;
    auto header = message.getHeader(headers::Death);
    if (!header || header->empty()) {
        return info;
    }

    auto parsed = nlohmann::json::parse(*header, nullptr, false);
    if (parsed.is_discarded()) {
        return info;
    }
    if (parsed.is_array()) {
        if (parsed.empty()) {
            return info;
        }
        parsed = parsed.front();
    }
    if (!parsed.is_object()) {
        return info;
    }

    try {
        info.reason = parsed.value("reason", "");
        info.queue = parsed.value("queue", "");
        info.exchange = parsed.value("exchange", "");
        if (parsed.contains("count") && parsed["count"].is_number_integer()) {
            info.count = parsed["count"].get<int64_t>();
        }
        const auto keys = parsed.find("routing-keys");
        if (keys != parsed.end() && keys->is_array() && !keys->empty() && keys->front().is_string()) {
            info.originalRoutingKey = keys->front().get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Malformed {} header on {}: {}", headers::Death, message.getMessageId(), e.what());
        return DeathInfo{};
    }
    return info;
}

DeadLetterConsumer::DeadLetterConsumer(std::shared_ptr<ConnectionManager> connectionManager,
                                       DeadLetterConfig config,
                                       std::shared_ptr<Publisher> republisher)
    : connectionManager_(std::move(connectionManager)),
      config_(std::move(config)),
      republisher_(std::move(republisher)) {
    if (!connectionManager_) {
        throw ConfigException("DeadLetterConsumer requires a connection manager");
    }
    if (config_.republish && !republisher_) {
        PublisherConfig publisherConfig;
        publisherConfig.exchange = config_.exchange;
        publisherConfig.declareExchange = false;
        republisher_ = std::make_shared<Publisher>(connectionManager_, publisherConfig);
    }
}

DeadLetterConsumer::~DeadLetterConsumer() {
    stop();
}

void DeadLetterConsumer::start() {
    if (config_.queue.empty()) {
        throw SetupException("Dead-letter queue name is not configured");
    }
    if (config_.deadLetterExchange.empty()) {
        throw SetupException("Dead-letter exchange name is not configured");
    }
    if (started_.exchange(true)) {
        throw SetupException("Dead-letter consumer already started");
    }

    try {
        setup();
    } catch (const MessagingException& e) {
        healthy_ = false;
        if (e.getErrorType() == ErrorType::SetupError) {
            throw;
        }
        throw SetupException(std::string("Dead-letter consumer setup failed: ") + e.what());
    }

    running_ = true;
    thread_ = std::thread(&DeadLetterConsumer::run, this);
    spdlog::info("Dead-letter consumer started on queue '{}' (republish {})",
                 config_.queue, config_.republish ? "on" : "off");
}

void DeadLetterConsumer::stop(std::chrono::milliseconds grace) {
    if (!started_ || stopping_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stopMutex_);
    }
    stopCv_.notify_all();

    std::shared_ptr<IBrokerChannel> channel;
    std::string consumerTag;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel = channel_;
        consumerTag = consumerTag_;
    }
    if (channel && channel->isOpen() && !consumerTag.empty()) {
        auto cancelled = channel->cancel(consumerTag);
        if (!cancelled) {
            spdlog::warn("Failed to cancel dead-letter consumer: {}", cancelled.message);
        }
    }

    {
        std::unique_lock<std::mutex> lock(stopMutex_);
        if (!stopCv_.wait_for(lock, grace, [this] { return finished_; })) {
            spdlog::warn("Dead-letter consumer did not finish within {}ms", grace.count());
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        // Unacked deliveries return to the queue when the channel closes
        channel->close();
    }
    running_ = false;
    spdlog::info("Dead-letter consumer on queue '{}' stopped", config_.queue);
}

void DeadLetterConsumer::setAlertCallback(DeadLetterAlert callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    alertCallback_ = std::move(callback);
}

void DeadLetterConsumer::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

DeadLetterStats DeadLetterConsumer::getStats() const {
    DeadLetterStats stats;
    stats.messagesReceived = messagesReceived_.load();
    stats.messagesDropped = messagesDropped_.load();
    stats.messagesRepublished = messagesRepublished_.load();
    stats.republishFailures = republishFailures_.load();
    return stats;
}

void DeadLetterConsumer::setup() {
    std::shared_ptr<IBrokerChannel> channel;
    try {
        channel = connectionManager_->openChannel();
    } catch (const AuthenticationException&) {
        throw;
    } catch (const MessagingException& e) {
        throw SetupException(std::string("Cannot open dead-letter channel: ") + e.what());
    }

    auto check = [&](const Result<void>& result, const std::string& step) {
        if (!result) {
            channel->close();
            throw SetupException(step + " failed: " + result.message);
        }
    };

    check(channel->declareExchange(deadLetterExchangeFor(config_.deadLetterExchange)),
          "Declaring dead-letter exchange '" + config_.deadLetterExchange + "'");
    check(channel->declareQueue(deadLetterQueueFor(config_)),
          "Declaring dead-letter queue '" + config_.queue + "'");
    // Routing key is ignored by the fanout exchange
    check(channel->bindQueue(config_.queue, config_.deadLetterExchange, ""),
          "Binding dead-letter queue '" + config_.queue + "'");
    check(channel->setQos(config_.prefetchCount), "Setting dead-letter prefetch");

    auto consumed = channel->consume(config_.queue, "");
    if (!consumed) {
        channel->close();
        throw SetupException("Consuming from '" + config_.queue + "' failed: " + consumed.message);
    }

    std::lock_guard<std::mutex> lock(channelMutex_);
    channel_ = channel;
    consumerTag_ = consumed.value;
}

bool DeadLetterConsumer::reconnect() {
    std::shared_ptr<IBrokerChannel> old;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        old = std::move(channel_);
        consumerTag_.clear();
    }
    if (old) {
        old->close();
    }

    RetryPolicy policy = connectionManager_->getConfig().retry;
    const int maxAttempts = std::max(1, policy.maxAttempts);
    std::string lastError;
    for (int attempt = 1; attempt <= maxAttempts && !stopping_; ++attempt) {
        try {
            setup();
            healthy_ = true;
            spdlog::info("Dead-letter consumer re-subscribed to '{}'", config_.queue);
            return true;
        } catch (const AuthenticationException& e) {
            lastError = e.what();
            break;
        } catch (const MessagingException& e) {
            lastError = e.what();
        }
        if (attempt < maxAttempts && !sleepInterruptible(computeBackoffDelay(attempt, policy))) {
            return false;
        }
    }

    if (stopping_) {
        return false;
    }

    healthy_ = false;
    spdlog::error("Dead-letter consumer on '{}' failed permanently: {}", config_.queue, lastError);
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = errorCallback_;
    }
    if (callback) {
        callback("DLQ_CONSUMER_FAILED", lastError, "DeadLetterConsumer:" + config_.queue);
    }
    return false;
}

void DeadLetterConsumer::run() {
    while (!stopping_) {
        std::shared_ptr<IBrokerChannel> channel;
        {
            std::lock_guard<std::mutex> lock(channelMutex_);
            channel = channel_;
        }

        if (!channel || !channel->isOpen()) {
            if (!reconnect()) {
                break;
            }
            continue;
        }

        auto delivery = channel->nextDelivery(config_.pollInterval);
        if (delivery) {
            ++messagesReceived_;
            handle(channel, *delivery);
        }
    }

    if (!stopping_) {
        running_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        finished_ = true;
    }
    stopCv_.notify_all();
}

void DeadLetterConsumer::handle(const std::shared_ptr<IBrokerChannel>& channel, const InboundDelivery& delivery) {
    const Message& message = delivery.message;
    DeathInfo death = parseDeathHeader(message);

    if (!config_.republish || !republisher_) {
        settleTerminal(channel, delivery, death);
        return;
    }

    const int republished = message.getRepublishCount();
    if (republished >= config_.maxRepublishAttempts) {
        spdlog::error("Message {} reached {} republish attempts, giving up",
                      message.getMessageId(), republished);
        settleTerminal(channel, delivery, death);
        return;
    }

    if (!sleepInterruptible(config_.republishDelay)) {
        // Stopping; leave it for the next run
        auto requeued = channel->nack(delivery.deliveryTag, true);
        if (!requeued) {
            spdlog::debug("Requeue of dead letter {} failed: {}", delivery.deliveryTag, requeued.message);
        }
        return;
    }

    Message outbound = message.toOutbound();
    if (!death.originalRoutingKey.empty()) {
        outbound.setRoutingKey(death.originalRoutingKey);
    }
    outbound.removeHeader(headers::Death);
    outbound.setAttemptCount(message.getAttemptCount() + 1);
    outbound.setRepublishCount(republished + 1);

    auto published = republisher_->publish(outbound);
    if (published) {
        ++messagesRepublished_;
        spdlog::info("Republished dead letter {} to '{}' (republish {}/{})",
                     outbound.getMessageId(), outbound.getRoutingKey(),
                     republished + 1, config_.maxRepublishAttempts);
        auto acked = channel->ack(delivery.deliveryTag);
        if (!acked) {
            spdlog::warn("Failed to ack republished dead letter {}: {}", delivery.deliveryTag, acked.message);
        }
        return;
    }

    ++republishFailures_;
    spdlog::warn("Republish of {} failed: {}", outbound.getMessageId(), published.message);
    auto requeued = channel->nack(delivery.deliveryTag, true);
    if (!requeued) {
        spdlog::warn("Failed to requeue dead letter {}: {}", delivery.deliveryTag, requeued.message);
    }
}

void DeadLetterConsumer::settleTerminal(const std::shared_ptr<IBrokerChannel>& channel,
                                        const InboundDelivery& delivery, const DeathInfo& death) {
    const Message& message = delivery.message;
    spdlog::error("Dead letter: id={} routingKey={} reason={} queue={} deaths={} attempts={} republished={}",
                  message.getMessageId(),
                  death.originalRoutingKey.empty() ? message.getRoutingKey() : death.originalRoutingKey,
                  death.reason.empty() ? "unknown" : death.reason,
                  death.queue, death.count, message.getAttemptCount(), message.getRepublishCount());

    auto acked = channel->ack(delivery.deliveryTag);
    if (!acked) {
        spdlog::warn("Failed to ack dead letter {}: {}", delivery.deliveryTag, acked.message);
        return;
    }
    ++messagesDropped_;

    DeadLetterAlert alert;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        alert = alertCallback_;
    }
    if (alert) {
        try {
            alert(message, death);
        } catch (const std::exception& e) {
            spdlog::error("Dead-letter alert callback threw: {}", e.what());
        } catch (...) {
            spdlog::error("Dead-letter alert callback threw a non-standard exception");
        }
    }
}

bool DeadLetterConsumer::sleepInterruptible(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stopMutex_);
    return !stopCv_.wait_for(lock, duration, [this] { return stopping_.load(); });
}

} // namespace broker_messaging
