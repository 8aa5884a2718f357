#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "broker_messaging/attempt_store.hpp"
#include "broker_messaging/broker.hpp"
#include "broker_messaging/config.hpp"
#include "broker_messaging/connection_manager.hpp"
#include "broker_messaging/consumer.hpp"
#include "broker_messaging/dead_letter_consumer.hpp"
#include "broker_messaging/publisher.hpp"

namespace broker_messaging {

/**
 * @brief One service's messaging stack: connection, publisher, consumers and
 *        the dead-letter consumer, built from a MessagingConfig.
 *
 * Shutdown runs in a fixed order: consumers, then the dead-letter consumer,
 * then the publisher, then the connection. Each step gets the configured
 * grace period; overrunning it is logged and shutdown continues.
 */
class MessagingRuntime {
public:
    // Uses the AMQP transport
    explicit MessagingRuntime(MessagingConfig config);
    MessagingRuntime(MessagingConfig config, std::shared_ptr<IConnectionFactory> factory);
    ~MessagingRuntime();

    MessagingRuntime(const MessagingRuntime&) = delete;
    MessagingRuntime& operator=(const MessagingRuntime&) = delete;

    /**
     * @brief Connect, open the publisher and start the dead-letter consumer.
     * @throws AuthenticationException, ConnectionException or SetupException
     */
    void start();

    /**
     * @brief Create and start a consumer on the configured work queue.
     *
     * Every routing key is bound to the queue and handled by the same handler.
     * @throws SetupException if the runtime is not started or setup fails
     */
    std::shared_ptr<Consumer> addConsumer(const std::vector<std::string>& routingKeys, MessageHandler handler);

    // Same, with a caller-supplied consumer configuration
    std::shared_ptr<Consumer> addConsumer(const ConsumerConfig& consumerConfig,
                                          const std::vector<std::string>& routingKeys,
                                          MessageHandler handler);

    void shutdown();

    bool isStarted() const { return started_.load(); }
    // False once any component has given up
    bool isHealthy() const;

    Publisher& publisher();
    std::shared_ptr<ConnectionManager> connectionManager() const { return connectionManager_; }
    std::shared_ptr<DeadLetterConsumer> deadLetterConsumer() const { return deadLetterConsumer_; }

    void setErrorCallback(ErrorCallback callback);

    const MessagingConfig& getConfig() const { return config_; }

private:
    std::shared_ptr<IAttemptStore> createAttemptStore() const;

    MessagingConfig config_;
    std::shared_ptr<ConnectionManager> connectionManager_;
    std::shared_ptr<Publisher> publisher_;
    std::shared_ptr<DeadLetterConsumer> deadLetterConsumer_;
    std::shared_ptr<IAttemptStore> attemptStore_;

    mutable std::mutex consumersMutex_;
    std::vector<std::shared_ptr<Consumer>> consumers_;

    std::mutex callbackMutex_;
    ErrorCallback errorCallback_;

    std::atomic<bool> started_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace broker_messaging
