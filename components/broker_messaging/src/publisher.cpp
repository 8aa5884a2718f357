// src/publisher.cpp
#include "broker_messaging/publisher.hpp"
#include <spdlog/spdlog.h>

namespace broker_messaging {

Publisher::Publisher(std::shared_ptr<ConnectionManager> connectionManager, PublisherConfig config)
    : connectionManager_(std::move(connectionManager)), config_(std::move(config)) {
    if (!connectionManager_) {
        throw ConfigException("Publisher requires a connection manager");
    }
    spdlog::debug("Publisher created for exchange '{}'", config_.exchange);
}

Publisher::~Publisher() {
    close();
}

Result<void> Publisher::initialize() {
    std::lock_guard<std::mutex> lock(channelMutex_);
    auto channel = ensureChannel();
    if (!channel) {
        return Result<void>(channel.error, channel.message);
    }
    spdlog::info("Publisher initialized on exchange '{}'", config_.exchange);
    return Result<void>();
}

Result<PublishConfirmation> Publisher::publish(Message message) {
    if (closed_) {
        return fail(ErrorType::PublishError, "Publisher is closed");
    }

    auto valid = message.validate();
    if (!valid) {
        return fail(valid.error, valid.message);
    }

    message.ensureMessageId();
    if (message.getTimestamp().time_since_epoch().count() == 0) {
        message.setTimestampNow();
    }
    if (!message.hasHeader(headers::AttemptCount)) {
        message.setAttemptCount(0);
    }
    if (!config_.sourceService.empty() && !message.hasHeader(headers::SourceService)) {
        message.setSourceService(config_.sourceService);
    }
    if (!config_.persistentMessages) {
        message.setPersistent(false);
    }

    // Flow control: hold the publish until the broker lifts the block
    if (connectionManager_->getState() == ConnectionState::Blocked &&
        !connectionManager_->waitWhileBlocked(config_.confirmTimeout)) {
        ++confirmTimeouts_;
        return fail(ErrorType::TimeoutError,
                    "Connection still blocked by broker after " +
                    std::to_string(config_.confirmTimeout.count()) + "ms");
    }

    std::shared_ptr<IBrokerChannel> channel;
    uint64_t sequence = 0;
    const auto started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        auto acquired = ensureChannel();
        if (!acquired) {
            return fail(acquired.error, acquired.message);
        }
        channel = acquired.value;

        auto sent = channel->publish(config_.exchange, message);
        if (!sent) {
            dropChannel(channel);
            return fail(sent.error == ErrorType::ChannelError ? ErrorType::PublishError : sent.error,
                        "Failed to publish " + message.getMessageId() + ": " + sent.message);
        }
        sequence = sent.value;
    }
    ++messagesPublished_;

    ConfirmStatus status = channel->waitForConfirm(sequence, config_.confirmTimeout);
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    switch (status) {
        case ConfirmStatus::Ack: {
            ++messagesConfirmed_;
            spdlog::debug("Published {} to '{}' with routing key '{}' ({}ms)",
                          message.getMessageId(), config_.exchange, message.getRoutingKey(), latency.count());
            PublishConfirmation confirmation;
            confirmation.sequenceNumber = sequence;
            confirmation.messageId = message.getMessageId();
            confirmation.latency = latency;
            return Result<PublishConfirmation>(confirmation);
        }
        case ConfirmStatus::Nack:
            ++messagesNacked_;
            return fail(ErrorType::PublishError,
                        "Broker rejected message " + message.getMessageId());
        case ConfirmStatus::Timeout:
            ++confirmTimeouts_;
            return fail(ErrorType::TimeoutError,
                        "No confirm for message " + message.getMessageId() + " within " +
                        std::to_string(config_.confirmTimeout.count()) + "ms");
        case ConfirmStatus::ChannelClosed:
        default:
            {
                std::lock_guard<std::mutex> lock(channelMutex_);
                dropChannel(channel);
            }
            return fail(ErrorType::ChannelError,
                        "Channel closed before message " + message.getMessageId() + " was confirmed");
    }
}

Result<PublishConfirmation> Publisher::publish(const std::string& routingKey, const nlohmann::json& body) {
    return publish(Message::fromJson(routingKey, body));
}

void Publisher::close() {
    if (closed_.exchange(true)) {
        return;
    }
    std::shared_ptr<IBrokerChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        channel->close();
    }
    spdlog::debug("Publisher closed ({} published, {} confirmed)",
                  messagesPublished_.load(), messagesConfirmed_.load());
}

PublisherStats Publisher::getStats() const {
    PublisherStats stats;
    stats.messagesPublished = messagesPublished_.load();
    stats.messagesConfirmed = messagesConfirmed_.load();
    stats.messagesNacked = messagesNacked_.load();
    stats.confirmTimeouts = confirmTimeouts_.load();
    stats.publishFailed = publishFailed_.load();
    stats.channelsOpened = channelsOpened_.load();
    return stats;
}

void Publisher::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

Result<std::shared_ptr<IBrokerChannel>> Publisher::ensureChannel() {
    using ChannelResult = Result<std::shared_ptr<IBrokerChannel>>;

    if (channel_ && channel_->isOpen()) {
        return ChannelResult(channel_);
    }
    channel_.reset();

    std::shared_ptr<IBrokerChannel> channel;
    try {
        channel = connectionManager_->openChannel();
    } catch (const MessagingException& e) {
        return ChannelResult(e.getErrorType(), e.what());
    }

    auto confirms = channel->enableConfirms();
    if (!confirms) {
        channel->close();
        return ChannelResult(confirms.error, "Failed to enable publisher confirms: " + confirms.message);
    }

    if (config_.declareExchange) {
        ExchangeDeclaration exchange;
        exchange.name = config_.exchange;
        exchange.type = config_.exchangeType;
        auto declared = channel->declareExchange(exchange);
        if (!declared) {
            channel->close();
            return ChannelResult(ErrorType::SetupError,
                                 "Failed to declare exchange '" + config_.exchange + "': " + declared.message);
        }
    }

    ++channelsOpened_;
    spdlog::debug("Publisher opened confirm channel {}", channel->getId());
    channel_ = channel;
    return ChannelResult(channel);
}

void Publisher::dropChannel(const std::shared_ptr<IBrokerChannel>& channel) {
    if (channel_ == channel) {
        channel_.reset();
    }
}

Result<PublishConfirmation> Publisher::fail(ErrorType type, const std::string& message) {
    ++publishFailed_;
    spdlog::error("Publish failed ({}): {}", errorTypeToString(type), message);

    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = errorCallback_;
    }
    if (callback) {
        callback(errorTypeToString(type), message, "Publisher");
    }
    return Result<PublishConfirmation>(type, message);
}

} // namespace broker_messaging
