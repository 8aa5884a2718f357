#pragma once

#include <amqp.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "broker_messaging/broker.hpp"

namespace broker_messaging {

class AmqpChannel;

// Opens AMQP 0-9-1 connections with rabbitmq-c
class AmqpConnectionFactory : public IConnectionFactory {
public:
    std::shared_ptr<IBrokerConnection> connect(const ConnectionConfig& config) override;
};

/**
 * @brief One rabbitmq-c connection shared by every channel of the process.
 *
 * rabbitmq-c state is not thread safe, so every call into it happens under
 * ioMutex_. A single reader thread owns inbound frame processing: it routes
 * deliveries and publisher confirms to their channel, answers broker-initiated
 * channel and connection closes, and reports blocked / unblocked / shutdown
 * events to the observer.
 */
class AmqpConnection : public IBrokerConnection,
                       public std::enable_shared_from_this<AmqpConnection> {
public:
    AmqpConnection(amqp_connection_state_t state, const ConnectionConfig& config);
    ~AmqpConnection() override;

    AmqpConnection(const AmqpConnection&) = delete;
    AmqpConnection& operator=(const AmqpConnection&) = delete;

    // Starts the reader thread; called once by the factory
    void start();

    bool isOpen() const override;
    std::shared_ptr<IBrokerChannel> openChannel() override;
    void setObserver(std::weak_ptr<IConnectionObserver> observer) override;
    void close() override;

private:
    friend class AmqpChannel;

    enum class EventKind { Blocked, Unblocked, Shutdown };
    struct Event {
        EventKind kind;
        std::string reason;
    };

    void readerLoop();
    bool drainFrames(std::vector<Event>& events);
    void handleFrame(const amqp_frame_t& frame, std::vector<Event>& events);
    void dispatchEvents(const std::vector<Event>& events);

    // Both require ioMutex_ held
    Result<void> checkReply(const amqp_rpc_reply_t& reply, uint16_t channelId, const std::string& context);
    void failConnection(const std::string& reason);

    std::shared_ptr<AmqpChannel> findChannel(uint16_t id);
    void forgetChannel(uint16_t id);

    // Channels touched while ioMutex_ is held; released only after it is unlocked
    std::vector<std::shared_ptr<AmqpChannel>> graveyard_;

    amqp_connection_state_t state_;
    ConnectionConfig config_;

    mutable std::mutex ioMutex_;
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> open_{true};
    std::atomic<bool> closing_{false};
    std::atomic<bool> shutdownReported_{false};
    std::string lostReason_;

    std::mutex channelsMutex_;
    std::map<uint16_t, std::weak_ptr<AmqpChannel>> channels_;
    uint16_t nextChannelId_{1};

    std::mutex observerMutex_;
    std::weak_ptr<IConnectionObserver> observer_;
};

class AmqpChannel : public IBrokerChannel {
public:
    AmqpChannel(std::weak_ptr<AmqpConnection> connection, uint16_t id);
    ~AmqpChannel() override;

    uint16_t getId() const override { return id_; }
    bool isOpen() const override;

    Result<void> declareExchange(const ExchangeDeclaration& exchange) override;
    Result<void> declareQueue(const QueueDeclaration& queue) override;
    Result<void> bindQueue(const std::string& queue, const std::string& exchange,
                           const std::string& routingKey) override;
    Result<void> setQos(uint16_t prefetchCount) override;

    Result<void> enableConfirms() override;
    Result<uint64_t> publish(const std::string& exchange, const Message& message) override;
    ConfirmStatus waitForConfirm(uint64_t sequenceNumber, std::chrono::milliseconds timeout) override;

    Result<std::string> consume(const std::string& queue, const std::string& consumerTag) override;
    Result<void> cancel(const std::string& consumerTag) override;
    std::optional<InboundDelivery> nextDelivery(std::chrono::milliseconds timeout) override;

    Result<void> ack(uint64_t deliveryTag) override;
    Result<void> nack(uint64_t deliveryTag, bool requeue) override;
    Result<void> reject(uint64_t deliveryTag, bool requeue) override;

    void close() override;

private:
    friend class AmqpConnection;

    // Runs one synchronous method under the connection's I/O lock and checks the reply
    template<typename Call>
    Result<void> rpc(const std::string& context, Call&& call);

    Result<void> settle(const std::string& context, int status);

    // Reader-thread callbacks, ioMutex_ of the connection held
    void onDeliver(const amqp_basic_deliver_t& deliver);
    void onHeader(const amqp_basic_properties_t& properties, uint64_t bodySize);
    void onBody(const amqp_bytes_t& fragment);
    void onConfirm(uint64_t deliveryTag, bool multiple, ConfirmStatus status);
    void markClosed(const std::string& reason, bool brokerSideClosed);

    void completeDelivery();

    std::weak_ptr<AmqpConnection> connection_;
    const uint16_t id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{true};
    bool brokerSideClosed_{false};
    std::string closeReason_;

    bool confirmsEnabled_{false};
    uint64_t publishSequence_{0};
    std::set<uint64_t> pendingConfirms_;
    std::map<uint64_t, ConfirmStatus> confirmed_;

    std::deque<InboundDelivery> deliveries_;

    // Delivery being assembled from method, header and body frames
    struct Assembly {
        InboundDelivery delivery;
        uint64_t bodySize{0};
        std::vector<uint8_t> body;
        bool active{false};
    } assembly_;
};

// AMQP utility functions
std::string amqpErrorToString(int amqpStatus);
ErrorType amqpErrorToErrorType(int amqpStatus);
std::string describeReply(const amqp_rpc_reply_t& reply);
bool isAuthenticationFailure(const amqp_rpc_reply_t& reply);
Headers amqpTableToHeaders(const amqp_table_t& table);

} // namespace broker_messaging
