#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "broker_messaging/attempt_store.hpp"
#include "broker_messaging/broker.hpp"
#include "broker_messaging/connection_manager.hpp"
#include "broker_messaging/delivery.hpp"
#include "broker_messaging/message.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

using MessageHandler = std::function<HandlerOutcome(const Message& message)>;

/**
 * @brief Consumes the service's work queue and settles each delivery from the
 *        handler's outcome.
 *
 * Deliveries are handed to a fixed pool of workers; the worker is picked by
 * hashing the routing key so messages sharing a key are handled in order. At
 * most prefetchCount deliveries are unacknowledged at any time. Retry requeues
 * the delivery until its attempt count reaches the policy's maximum, after
 * which it is dead-lettered.
 */
class Consumer {
public:
    Consumer(std::shared_ptr<ConnectionManager> connectionManager,
             ConsumerConfig config,
             std::shared_ptr<IAttemptStore> attemptStore = nullptr);
    ~Consumer();

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    /**
     * @brief Register a handler for a topic pattern ('*' one word, '#' any words).
     * @throws SetupException once the consumer has started
     */
    void subscribe(const std::string& pattern, MessageHandler handler);

    /**
     * @brief Declare and bind the queue, apply QoS and start consuming.
     *
     * Returns once the broker accepted the subscription; deliveries are then
     * processed in the background until stopConsuming().
     *
     * @throws SetupException if the topology or subscription cannot be established
     */
    void startConsuming();

    // Registers one subscription per routing key with the same handler, then starts
    void startConsuming(const std::vector<std::string>& routingKeys, MessageHandler handler);

    /**
     * @brief Cancel the subscription and drain in-flight work.
     *
     * Handlers already running get up to the grace period to finish and settle.
     * Deliveries received but not yet dispatched are requeued.
     */
    void stopConsuming(std::chrono::milliseconds grace = std::chrono::seconds(10));

    bool isRunning() const { return running_.load(); }
    bool isHealthy() const { return healthy_.load(); }

    ConsumerStats getStats() const;
    void setErrorCallback(ErrorCallback callback);

    const ConsumerConfig& getConfig() const { return config_; }

private:
    struct Subscription {
        std::string pattern;
        MessageHandler handler;
    };

    struct WorkItem {
        Message message;
        std::shared_ptr<DeliveryHandle> handle;
    };

    struct Worker {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<WorkItem> queue;
        std::thread thread;
    };

    // Throws SetupException (or AuthenticationException) on failure
    void setupSubscription();
    bool resubscribe();

    void dispatchLoop();
    void workerLoop(Worker& worker);
    void process(WorkItem& item);

    const Subscription* findSubscription(const std::string& routingKey) const;
    int recordAttempt(const Message& message);
    // Message id, or a key derived from routing key and payload when the producer set none
    static std::string attemptKey(const Message& message);
    void forgetAttempts(const Message& message);
    void releaseInFlight();
    void reportError(const std::string& code, const std::string& message);

    std::shared_ptr<ConnectionManager> connectionManager_;
    ConsumerConfig config_;
    std::shared_ptr<IAttemptStore> attemptStore_;
    // Used while attemptStore_ reports errors
    InMemoryAttemptStore fallbackStore_;
    std::vector<Subscription> subscriptions_;

    std::mutex channelMutex_;
    std::shared_ptr<IBrokerChannel> channel_;
    std::string consumerTag_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> abandon_{false};
    std::atomic<bool> workersExit_{false};
    std::atomic<bool> healthy_{true};

    std::thread dispatcher_;
    std::vector<std::unique_ptr<Worker>> workers_;

    std::mutex stopMutex_;
    std::condition_variable stopCv_;

    mutable std::mutex inFlightMutex_;
    std::condition_variable inFlightCv_;
    size_t inFlight_{0};

    mutable std::mutex callbackMutex_;
    ErrorCallback errorCallback_;

    std::atomic<uint64_t> messagesReceived_{0};
    std::atomic<uint64_t> messagesAcknowledged_{0};
    std::atomic<uint64_t> messagesRequeued_{0};
    std::atomic<uint64_t> messagesDeadLettered_{0};
    std::atomic<uint64_t> processingErrors_{0};
    std::atomic<uint64_t> resubscribes_{0};
    std::atomic<uint64_t> peakInFlight_{0};
};

} // namespace broker_messaging
