#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "broker_messaging/message.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

// Transport seam between the messaging layer and a broker implementation.
// The AMQP implementation lives in amqp_broker.hpp; tests use an in-memory broker.

struct ExchangeDeclaration {
    std::string name;
    ExchangeType type{ExchangeType::Topic};
    bool durable{true};
    bool autoDelete{false};
};

struct QueueDeclaration {
    std::string name;
    bool durable{true};
    bool exclusive{false};
    bool autoDelete{false};

    // Queue arguments; empty / zero means not set
    std::string deadLetterExchange;
    std::chrono::milliseconds messageTtl{0};
};

// Outcome of waiting for a publisher confirm
enum class ConfirmStatus {
    Ack,
    Nack,
    Timeout,
    ChannelClosed
};

std::string confirmStatusToString(ConfirmStatus status);

struct InboundDelivery {
    Message message;
    uint64_t deliveryTag{0};
    std::string consumerTag;
};

/**
 * @brief Logical channel multiplexed over a broker connection.
 *
 * Operations on a closed channel fail with ErrorType::ChannelError. A channel
 * that the broker closes (protocol error, connection loss) stays closed; callers
 * open a new one through the connection manager.
 */
class IBrokerChannel {
public:
    virtual ~IBrokerChannel() = default;

    virtual uint16_t getId() const = 0;
    virtual bool isOpen() const = 0;

    // Topology
    virtual Result<void> declareExchange(const ExchangeDeclaration& exchange) = 0;
    virtual Result<void> declareQueue(const QueueDeclaration& queue) = 0;
    virtual Result<void> bindQueue(const std::string& queue, const std::string& exchange,
                                   const std::string& routingKey) = 0;
    virtual Result<void> setQos(uint16_t prefetchCount) = 0;

    // Publishing
    virtual Result<void> enableConfirms() = 0;

    /**
     * @brief Send a message to an exchange.
     * @return Publish sequence number to pass to waitForConfirm
     */
    virtual Result<uint64_t> publish(const std::string& exchange, const Message& message) = 0;

    /**
     * @brief Block until the broker confirms the given publish.
     *
     * Only the confirm for sequenceNumber is awaited; confirms for other
     * publishes on the same channel are routed to their own waiters.
     */
    virtual ConfirmStatus waitForConfirm(uint64_t sequenceNumber, std::chrono::milliseconds timeout) = 0;

    // Consuming
    virtual Result<std::string> consume(const std::string& queue, const std::string& consumerTag) = 0;
    virtual Result<void> cancel(const std::string& consumerTag) = 0;
    virtual std::optional<InboundDelivery> nextDelivery(std::chrono::milliseconds timeout) = 0;

    // Settlement
    virtual Result<void> ack(uint64_t deliveryTag) = 0;
    virtual Result<void> nack(uint64_t deliveryTag, bool requeue) = 0;
    virtual Result<void> reject(uint64_t deliveryTag, bool requeue) = 0;

    virtual void close() = 0;
};

/**
 * @brief Receives broker-initiated connection events.
 *
 * Callbacks run on the transport's I/O thread and must not block on it.
 */
class IConnectionObserver {
public:
    virtual ~IConnectionObserver() = default;

    virtual void onBlocked(const std::string& reason) = 0;
    virtual void onUnblocked() = 0;
    virtual void onShutdown(const std::string& reason, bool initiatedByApplication) = 0;
};

class IBrokerConnection {
public:
    virtual ~IBrokerConnection() = default;

    virtual bool isOpen() const = 0;

    // Throws ChannelException when a channel cannot be opened
    virtual std::shared_ptr<IBrokerChannel> openChannel() = 0;

    virtual void setObserver(std::weak_ptr<IConnectionObserver> observer) = 0;

    virtual void close() = 0;
};

class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open one connection. No retries happen here.
     * @throws AuthenticationException when the broker refuses the credentials
     * @throws ConnectionException for any transient failure
     */
    virtual std::shared_ptr<IBrokerConnection> connect(const ConnectionConfig& config) = 0;
};

} // namespace broker_messaging
