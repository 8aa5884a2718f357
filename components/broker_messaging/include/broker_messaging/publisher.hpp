#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "broker_messaging/broker.hpp"
#include "broker_messaging/connection_manager.hpp"
#include "broker_messaging/message.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

struct PublishConfirmation {
    uint64_t sequenceNumber{0};
    std::string messageId;
    std::chrono::milliseconds latency{0};
};

// Publishes messages with broker confirms. A publish succeeds only once the
// broker acknowledged it; nacks, timeouts and channel failures are returned to
// the caller and never retried here.
class Publisher {
public:
    Publisher(std::shared_ptr<ConnectionManager> connectionManager, PublisherConfig config);
    ~Publisher();

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    // Opens the confirm channel and declares the exchange; optional, publish() does it lazily
    Result<void> initialize();

    /**
     * @brief Publish one message and wait for its confirm.
     *
     * Blocks for at most the configured confirm timeout after the message was
     * sent. Safe to call from multiple threads; sends are serialized on the
     * channel while confirm waits run concurrently.
     *
     * @return PublishError on broker nack or send failure, TimeoutError when no
     *         confirm arrived in time, ConnectionError / AuthenticationError when
     *         no connection could be obtained
     */
    Result<PublishConfirmation> publish(Message message);
    Result<PublishConfirmation> publish(const std::string& routingKey, const nlohmann::json& body);

    void close();

    PublisherStats getStats() const;
    void setErrorCallback(ErrorCallback callback);

    const PublisherConfig& getConfig() const { return config_; }

private:
    // Requires channelMutex_ held
    Result<std::shared_ptr<IBrokerChannel>> ensureChannel();
    void dropChannel(const std::shared_ptr<IBrokerChannel>& channel);
    Result<PublishConfirmation> fail(ErrorType type, const std::string& message);

    std::shared_ptr<ConnectionManager> connectionManager_;
    PublisherConfig config_;

    // Guards channel_ and serializes sends
    std::mutex channelMutex_;
    std::shared_ptr<IBrokerChannel> channel_;
    std::atomic<bool> closed_{false};

    mutable std::mutex callbackMutex_;
    ErrorCallback errorCallback_;

    std::atomic<uint64_t> messagesPublished_{0};
    std::atomic<uint64_t> messagesConfirmed_{0};
    std::atomic<uint64_t> messagesNacked_{0};
    std::atomic<uint64_t> confirmTimeouts_{0};
    std::atomic<uint64_t> publishFailed_{0};
    std::atomic<uint64_t> channelsOpened_{0};
};

} // namespace broker_messaging
