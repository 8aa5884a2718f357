// src/consumer.cpp
#include "broker_messaging/consumer.hpp"
#include "broker_messaging/backoff.hpp"
#include "broker_messaging/topology.hpp"
#include <algorithm>
#include <cstdio>
#include <spdlog/spdlog.h>

namespace broker_messaging {

Consumer::Consumer(std::shared_ptr<ConnectionManager> connectionManager,
                   ConsumerConfig config,
                   std::shared_ptr<IAttemptStore> attemptStore)
    : connectionManager_(std::move(connectionManager)),
      config_(std::move(config)),
      attemptStore_(std::move(attemptStore)) {
    if (!connectionManager_) {
        throw ConfigException("Consumer requires a connection manager");
    }
    if (!attemptStore_) {
        attemptStore_ = std::make_shared<InMemoryAttemptStore>();
    }
    spdlog::debug("Consumer created for queue '{}'", config_.queue);
}

Consumer::~Consumer() {
    stopConsuming();
    workersExit_ = true;

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    for (auto& worker : workers_) {
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
        }
        worker->cv.notify_all();
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

void Consumer::subscribe(const std::string& pattern, MessageHandler handler) {
    if (started_) {
        throw SetupException("Cannot subscribe to '" + pattern + "' after the consumer has started");
    }
    if (pattern.empty() || !handler) {
        throw SetupException("Subscription requires a routing pattern and a handler");
    }
    subscriptions_.push_back(Subscription{pattern, std::move(handler)});
}

void Consumer::startConsuming(const std::vector<std::string>& routingKeys, MessageHandler handler) {
    for (const auto& key : routingKeys) {
        subscribe(key, handler);
    }
    startConsuming();
}

void Consumer::startConsuming() {
    if (config_.queue.empty()) {
        throw SetupException("Consumer queue name is not configured");
    }
    if (subscriptions_.empty()) {
        throw SetupException("Consumer for queue '" + config_.queue + "' has no subscriptions");
    }
    if (started_.exchange(true)) {
        throw SetupException("Consumer for queue '" + config_.queue + "' already started");
    }

    try {
        setupSubscription();
    } catch (const MessagingException& e) {
        healthy_ = false;
        spdlog::error("Consumer setup for queue '{}' failed: {}", config_.queue, e.what());
        reportError("CONSUMER_SETUP_FAILED", e.what());
        if (e.getErrorType() == ErrorType::SetupError) {
            throw;
        }
        throw SetupException("Consumer setup for queue '" + config_.queue + "' failed: " + e.what());
    }

    running_ = true;
    healthy_ = true;

    const int workerCount = std::max(1, config_.concurrentConsumers);
    for (int i = 0; i < workerCount; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
    for (auto& worker : workers_) {
        Worker* raw = worker.get();
        worker->thread = std::thread([this, raw] { workerLoop(*raw); });
    }
    dispatcher_ = std::thread(&Consumer::dispatchLoop, this);

    spdlog::info("Consuming from queue '{}' with {} workers, prefetch {}",
                 config_.queue, workerCount, config_.prefetchCount);
}

void Consumer::stopConsuming(std::chrono::milliseconds grace) {
    if (!started_ || stopping_.exchange(true)) {
        return;
    }

    spdlog::info("Stopping consumer on queue '{}' (grace {}ms)", config_.queue, grace.count());
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
    }
    stopCv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
    }
    inFlightCv_.notify_all();

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
            spdlog::warn("Failed to cancel consumer '{}': {}", consumerTag, cancelled.message);
        }
    }

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    // Received but never dispatched
    if (channel) {
        size_t requeued = 0;
        while (auto delivery = channel->nextDelivery(std::chrono::milliseconds(0))) {
            auto result = channel->nack(delivery->deliveryTag, true);
            if (!result) {
                spdlog::debug("Requeue of undispatched delivery {} failed: {}",
                              delivery->deliveryTag, result.message);
            }
            ++requeued;
        }
        if (requeued > 0) {
            spdlog::info("Requeued {} undispatched deliveries", requeued);
        }
    }

    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(inFlightMutex_);
        drained = inFlightCv_.wait_for(lock, grace, [this] { return inFlight_ == 0; });
        if (!drained) {
            spdlog::warn("Grace period of {}ms elapsed with {} deliveries in flight on queue '{}'",
                         grace.count(), inFlight_, config_.queue);
        }
    }

    if (!drained) {
        abandon_ = true;
    }
    workersExit_ = true;
    for (auto& worker : workers_) {
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
        }
        worker->cv.notify_all();
        // A handler stuck past the grace period is joined by the destructor
        if (drained && worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        channel->close();
    }

    running_ = false;
    spdlog::info("Consumer on queue '{}' stopped", config_.queue);
}

ConsumerStats Consumer::getStats() const {
    ConsumerStats stats;
    stats.messagesReceived = messagesReceived_.load();
    stats.messagesAcknowledged = messagesAcknowledged_.load();
    stats.messagesRequeued = messagesRequeued_.load();
    stats.messagesDeadLettered = messagesDeadLettered_.load();
    stats.processingErrors = processingErrors_.load();
    stats.resubscribes = resubscribes_.load();
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        stats.inFlight = inFlight_;
    }
    stats.peakInFlight = peakInFlight_.load();
    return stats;
}

void Consumer::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

void Consumer::setupSubscription() {
    std::shared_ptr<IBrokerChannel> channel;
    try {
        channel = connectionManager_->openChannel();
    } catch (const AuthenticationException&) {
        throw;
    } catch (const MessagingException& e) {
        throw SetupException(std::string("Cannot open consumer channel: ") + e.what());
    }

    auto check = [&](const Result<void>& result, const std::string& step) {
        if (!result) {
            channel->close();
            throw SetupException(step + " failed: " + result.message);
        }
    };

    if (config_.declareExchange) {
        ExchangeDeclaration exchange;
        exchange.name = config_.exchange;
        exchange.type = config_.exchangeType;
        check(channel->declareExchange(exchange), "Declaring exchange '" + config_.exchange + "'");

        if (!config_.deadLetterExchange.empty()) {
            check(channel->declareExchange(deadLetterExchangeFor(config_.deadLetterExchange)),
                  "Declaring dead-letter exchange '" + config_.deadLetterExchange + "'");
        }
    }

    check(channel->declareQueue(primaryQueueFor(config_)), "Declaring queue '" + config_.queue + "'");

    for (const auto& subscription : subscriptions_) {
        check(channel->bindQueue(config_.queue, config_.exchange, subscription.pattern),
              "Binding '" + config_.queue + "' to '" + subscription.pattern + "'");
    }

    check(channel->setQos(config_.prefetchCount), "Setting prefetch");

    auto consumed = channel->consume(config_.queue, config_.consumerTag);
    if (!consumed) {
        channel->close();
        throw SetupException("Consuming from '" + config_.queue + "' failed: " + consumed.message);
    }

    std::lock_guard<std::mutex> lock(channelMutex_);
    channel_ = channel;
    consumerTag_ = consumed.value;
    spdlog::debug("Consumer '{}' subscribed to queue '{}' on channel {}",
                  consumerTag_, config_.queue, channel->getId());
}

bool Consumer::resubscribe() {
    std::shared_ptr<IBrokerChannel> old;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        old = std::move(channel_);
        consumerTag_.clear();
    }
    if (old) {
        old->close();
    }

    spdlog::warn("Consumer channel for queue '{}' lost, re-subscribing", config_.queue);

    const int maxAttempts = std::max(1, config_.retry.maxAttempts);
    std::string lastError;
    for (int attempt = 1; attempt <= maxAttempts && !stopping_; ++attempt) {
        try {
            setupSubscription();
            ++resubscribes_;
            healthy_ = true;
            spdlog::info("Consumer re-subscribed to queue '{}'", config_.queue);
            return true;
        } catch (const AuthenticationException& e) {
            lastError = e.what();
            break;
        } catch (const MessagingException& e) {
            lastError = e.what();
        }

        if (attempt < maxAttempts) {
            auto delay = computeBackoffDelay(attempt, config_.retry);
            spdlog::warn("Re-subscribe attempt {}/{} for queue '{}' failed: {}. Retrying in {}ms",
                         attempt, maxAttempts, config_.queue, lastError, delay.count());
            std::unique_lock<std::mutex> lock(stopMutex_);
            stopCv_.wait_for(lock, delay, [this] { return stopping_.load(); });
        }
    }

    if (stopping_) {
        return false;
    }

    healthy_ = false;
    spdlog::error("Consumer on queue '{}' failed permanently: {}", config_.queue, lastError);
    reportError("CONSUMER_FAILED", lastError);
    return false;
}

void Consumer::dispatchLoop() {
    const size_t prefetch = config_.prefetchCount;

    while (!stopping_) {
        if (prefetch > 0) {
            std::unique_lock<std::mutex> lock(inFlightMutex_);
            inFlightCv_.wait_for(lock, config_.pollInterval, [&] {
                return inFlight_ < prefetch || stopping_.load();
            });
            if (stopping_) {
                break;
            }
            if (inFlight_ >= prefetch) {
                continue;
            }
        }

        std::shared_ptr<IBrokerChannel> channel;
        {
            std::lock_guard<std::mutex> lock(channelMutex_);
            channel = channel_;
        }

        if (!channel || !channel->isOpen()) {
            if (stopping_ || !resubscribe()) {
                break;
            }
            continue;
        }

        auto delivery = channel->nextDelivery(config_.pollInterval);
        if (!delivery) {
            continue;
        }

        ++messagesReceived_;
        {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            ++inFlight_;
            uint64_t peak = peakInFlight_.load();
            while (inFlight_ > peak && !peakInFlight_.compare_exchange_weak(peak, inFlight_)) {
            }
        }

        WorkItem item;
        item.handle = std::make_shared<DeliveryHandle>(channel, delivery->deliveryTag);
        item.message = std::move(delivery->message);

        // Same routing key, same worker
        size_t index = std::hash<std::string>{}(item.message.getRoutingKey()) % workers_.size();
        Worker& worker = *workers_[index];
        {
            std::lock_guard<std::mutex> lock(worker.mutex);
            worker.queue.push_back(std::move(item));
        }
        worker.cv.notify_one();
    }

    if (!stopping_) {
        running_ = false;
    }
    spdlog::debug("Dispatcher for queue '{}' exited", config_.queue);
}

void Consumer::workerLoop(Worker& worker) {
    while (true) {
        WorkItem item;
        {
            std::unique_lock<std::mutex> lock(worker.mutex);
            worker.cv.wait(lock, [&] { return !worker.queue.empty() || workersExit_.load(); });
            if (worker.queue.empty()) {
                break;
            }
            item = std::move(worker.queue.front());
            worker.queue.pop_front();
        }

        if (abandon_) {
            // Channel is about to close; the broker redelivers unsettled messages
            releaseInFlight();
            continue;
        }
        process(item);
    }
}

void Consumer::process(WorkItem& item) {
    const Message& message = item.message;
    const int attempt = recordAttempt(message);
    const int maxAttempts = std::max(1, config_.retry.maxAttempts);

    HandlerOutcome outcome = HandlerOutcome::Retry;
    const Subscription* subscription = findSubscription(message.getRoutingKey());
    if (!subscription) {
        spdlog::warn("No subscription matches routing key '{}', dead-lettering {}",
                     message.getRoutingKey(), message.getMessageId());
        outcome = HandlerOutcome::DeadLetter;
    } else {
        try {
            outcome = subscription->handler(message);
        } catch (const std::exception& e) {
            ++processingErrors_;
            spdlog::error("Handler for '{}' threw on {} (attempt {}): {}",
                          message.getRoutingKey(), message.getMessageId(), attempt, e.what());
            outcome = HandlerOutcome::Retry;
        } catch (...) {
            ++processingErrors_;
            spdlog::error("Handler for '{}' threw a non-standard exception on {} (attempt {})",
                          message.getRoutingKey(), message.getMessageId(), attempt);
            outcome = HandlerOutcome::Retry;
        }
    }

    Result<void> settled;
    switch (outcome) {
        case HandlerOutcome::Ack:
            settled = item.handle->ack();
            if (settled) {
                ++messagesAcknowledged_;
                forgetAttempts(message);
            }
            break;

        case HandlerOutcome::Retry:
            if (attempt >= maxAttempts) {
                spdlog::warn("Message {} on '{}' exhausted {} attempts, dead-lettering",
                             message.getMessageId(), message.getRoutingKey(), attempt);
                settled = item.handle->reject(false);
                if (settled) {
                    ++messagesDeadLettered_;
                    forgetAttempts(message);
                }
            } else {
                spdlog::debug("Requeueing {} (attempt {}/{})", message.getMessageId(), attempt, maxAttempts);
                settled = item.handle->nack(true);
                if (settled) {
                    ++messagesRequeued_;
                }
            }
            break;

        case HandlerOutcome::DeadLetter:
            spdlog::warn("Handler dead-lettered {} on '{}'", message.getMessageId(), message.getRoutingKey());
            settled = item.handle->reject(false);
            if (settled) {
                ++messagesDeadLettered_;
                forgetAttempts(message);
            }
            break;
    }

    if (!settled) {
        spdlog::warn("Could not settle delivery {} ({}): {}",
                     item.handle->getDeliveryTag(), handlerOutcomeToString(outcome), settled.message);
    }
    releaseInFlight();
}

const Consumer::Subscription* Consumer::findSubscription(const std::string& routingKey) const {
    for (const auto& subscription : subscriptions_) {
        if (topicMatches(subscription.pattern, routingKey)) {
            return &subscription;
        }
    }
    return nullptr;
}

int Consumer::recordAttempt(const Message& message) {
    const int previous = message.getAttemptCount();
    const std::string key = attemptKey(message);

    auto recorded = attemptStore_->increment(key);
    if (!recorded) {
        spdlog::warn("Attempt store unavailable for {}, counting locally: {}", key, recorded.message);
        recorded = fallbackStore_.increment(key);
    }
    return previous + recorded.value;
}

std::string Consumer::attemptKey(const Message& message) {
    if (!message.getMessageId().empty()) {
        return message.getMessageId();
    }

    // FNV-1a over routing key and payload
    uint64_t hash = 14695981039346656037ULL;
    auto mix = [&hash](uint8_t byte) {
        hash ^= byte;
        hash *= 1099511628211ULL;
    };
    for (char c : message.getRoutingKey()) {
        mix(static_cast<uint8_t>(c));
    }
    mix(0);
    for (uint8_t byte : message.getPayload()) {
        mix(byte);
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string("content-") + buffer;
}

void Consumer::forgetAttempts(const Message& message) {
    const std::string key = attemptKey(message);
    auto cleared = attemptStore_->clear(key);
    if (!cleared) {
        spdlog::debug("Failed to clear attempts for {}: {}", key, cleared.message);
    }
    fallbackStore_.clear(key);
}

void Consumer::releaseInFlight() {
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (inFlight_ > 0) {
            --inFlight_;
        }
    }
    inFlightCv_.notify_all();
}

void Consumer::reportError(const std::string& code, const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = errorCallback_;
    }
    if (callback) {
        callback(code, message, "Consumer:" + config_.queue);
    }
}

} // namespace broker_messaging
