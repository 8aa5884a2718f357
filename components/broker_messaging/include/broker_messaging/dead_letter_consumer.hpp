#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "broker_messaging/broker.hpp"
#include "broker_messaging/connection_manager.hpp"
#include "broker_messaging/message.hpp"
#include "broker_messaging/publisher.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

// Parsed from the first entry of the broker's x-death header
struct DeathInfo {
    std::string reason;
    std::string queue;
    std::string exchange;
    std::string originalRoutingKey;
    int64_t count{0};
};

// Missing or malformed headers yield an empty DeathInfo
DeathInfo parseDeathHeader(const Message& message);

// Invoked once per message that leaves the dead-letter queue for good
using DeadLetterAlert = std::function<void(const Message& message, const DeathInfo& death)>;

/**
 * @brief Drains the dead-letter queue.
 *
 * Runs on its own channel and thread, independent of the primary consumers.
 * By default every dead letter is logged and acknowledged. With republish
 * enabled, messages go back to the primary exchange after a delay until their
 * republish count reaches the configured maximum.
 */
class DeadLetterConsumer {
public:
    // A publisher is created from the config when republish is on and none is given
    DeadLetterConsumer(std::shared_ptr<ConnectionManager> connectionManager,
                       DeadLetterConfig config,
                       std::shared_ptr<Publisher> republisher = nullptr);
    ~DeadLetterConsumer();

    DeadLetterConsumer(const DeadLetterConsumer&) = delete;
    DeadLetterConsumer& operator=(const DeadLetterConsumer&) = delete;

    // @throws SetupException if the dead-letter topology cannot be established
    void start();
    void stop(std::chrono::milliseconds grace = std::chrono::seconds(10));

    bool isRunning() const { return running_.load(); }
    bool isHealthy() const { return healthy_.load(); }

    void setAlertCallback(DeadLetterAlert callback);
    void setErrorCallback(ErrorCallback callback);

    DeadLetterStats getStats() const;
    const DeadLetterConfig& getConfig() const { return config_; }

private:
    void setup();
    bool reconnect();
    void run();
    void handle(const std::shared_ptr<IBrokerChannel>& channel, const InboundDelivery& delivery);
    void settleTerminal(const std::shared_ptr<IBrokerChannel>& channel, const InboundDelivery& delivery,
                        const DeathInfo& death);
    bool sleepInterruptible(std::chrono::milliseconds duration);

    std::shared_ptr<ConnectionManager> connectionManager_;
    DeadLetterConfig config_;
    std::shared_ptr<Publisher> republisher_;

    std::mutex channelMutex_;
    std::shared_ptr<IBrokerChannel> channel_;
    std::string consumerTag_;

    std::thread thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> healthy_{true};

    std::mutex stopMutex_;
    std::condition_variable stopCv_;
    bool finished_{false};

    mutable std::mutex callbackMutex_;
    DeadLetterAlert alertCallback_;
    ErrorCallback errorCallback_;

    std::atomic<uint64_t> messagesReceived_{0};
    std::atomic<uint64_t> messagesDropped_{0};
    std::atomic<uint64_t> messagesRepublished_{0};
    std::atomic<uint64_t> republishFailures_{0};
};

} // namespace broker_messaging
