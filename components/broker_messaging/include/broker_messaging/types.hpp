#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace broker_messaging {

// Connection states
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Blocked,
    ShuttingDown
};

// Error types
enum class ErrorType {
    None,
    ConnectionError,
    ChannelError,
    AuthenticationError,
    NetworkError,
    ProtocolError,
    TimeoutError,
    PublishError,
    SetupError,
    ConfigError,
    ResourceError
};

// What a message handler decided to do with a delivery
enum class HandlerOutcome {
    Ack,
    Retry,
    DeadLetter
};

enum class ExchangeType {
    Direct,
    Fanout,
    Topic,
    Headers
};

// Result template for operations that can succeed or fail
template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(T value) : success(true), value(std::move(value)), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    operator bool() const { return success; }

    T& operator*() { return value; }
    const T& operator*() const { return value; }

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }

    bool success;
    T value{};
    ErrorType error{ErrorType::None};
    std::string message;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : success(true), error(ErrorType::None) {}

    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    operator bool() const { return success; }

    bool success;
    ErrorType error{ErrorType::None};
    std::string message;
};

// Shared by connection establishment and consumer redelivery decisions
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{10000};
    double multiplier{2.0};
};

// Connection configuration
struct ConnectionConfig {
    std::string host{"localhost"};
    int port{5672};
    std::string vhost{"/"};
    std::string username{"guest"};
    std::string password{"guest"};

    // Advertised to the broker as connection_name
    std::string connectionName;

    std::chrono::seconds heartbeat{60};
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(30)};
    uint32_t frameMax{131072};
    uint16_t channelMax{0};

    RetryPolicy retry;
};

// Publisher configuration
struct PublisherConfig {
    std::string exchange{"events"};
    ExchangeType exchangeType{ExchangeType::Topic};
    bool declareExchange{true};
    bool persistentMessages{true};
    std::chrono::milliseconds confirmTimeout{5000};

    // Stamped as x-source-service on outbound messages when set
    std::string sourceService;
};

// Consumer configuration
struct ConsumerConfig {
    std::string exchange{"events"};
    ExchangeType exchangeType{ExchangeType::Topic};
    bool declareExchange{true};

    std::string queue;
    std::string deadLetterExchange{"events.dlx"};
    std::chrono::milliseconds messageTtl{30000};

    uint16_t prefetchCount{10};
    int concurrentConsumers{3};
    RetryPolicy retry;

    std::string consumerTag;
    std::chrono::milliseconds pollInterval{100};
};

// Dead-letter consumer configuration
struct DeadLetterConfig {
    std::string deadLetterExchange{"events.dlx"};
    std::string queue;
    uint16_t prefetchCount{10};

    // Re-publish to the primary exchange instead of log-and-drop
    bool republish{false};
    std::string exchange{"events"};
    std::chrono::milliseconds republishDelay{5000};
    int maxRepublishAttempts{3};

    std::chrono::milliseconds pollInterval{100};
};

// Statistics snapshots
struct ConnectionStats {
    uint64_t connectAttempts{0};
    uint64_t successfulConnects{0};
    uint64_t failedConnects{0};
    uint64_t reconnects{0};
    uint64_t blockedEpisodes{0};
    ConnectionState state{ConnectionState::Disconnected};
};

struct PublisherStats {
    uint64_t messagesPublished{0};
    uint64_t messagesConfirmed{0};
    uint64_t messagesNacked{0};
    uint64_t confirmTimeouts{0};
    uint64_t publishFailed{0};
    uint64_t channelsOpened{0};
};

struct ConsumerStats {
    uint64_t messagesReceived{0};
    uint64_t messagesAcknowledged{0};
    uint64_t messagesRequeued{0};
    uint64_t messagesDeadLettered{0};
    uint64_t processingErrors{0};
    uint64_t resubscribes{0};
    uint64_t inFlight{0};
    uint64_t peakInFlight{0};
};

struct DeadLetterStats {
    uint64_t messagesReceived{0};
    uint64_t messagesDropped{0};
    uint64_t messagesRepublished{0};
    uint64_t republishFailures{0};
};

// Well-known message headers
namespace headers {
constexpr const char* AttemptCount = "x-attempt-count";
constexpr const char* RepublishCount = "x-republish-count";
constexpr const char* SourceService = "x-source-service";
constexpr const char* Death = "x-death";
} // namespace headers

// Callback types
using ErrorCallback = std::function<void(const std::string& errorCode, const std::string& message, const std::string& context)>;
using StateListener = std::function<void(ConnectionState previous, ConnectionState current, const std::string& reason)>;

// Exception classes
class MessagingException : public std::runtime_error {
public:
    explicit MessagingException(const std::string& message, ErrorType type = ErrorType::None);
    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType_;
};

class ConnectionException : public MessagingException {
public:
    explicit ConnectionException(const std::string& message);
};

class AuthenticationException : public MessagingException {
public:
    explicit AuthenticationException(const std::string& message);
};

class ChannelException : public MessagingException {
public:
    explicit ChannelException(const std::string& message);
};

class TimeoutException : public MessagingException {
public:
    explicit TimeoutException(const std::string& message);
};

class PublishException : public MessagingException {
public:
    explicit PublishException(const std::string& message);
};

class SetupException : public MessagingException {
public:
    explicit SetupException(const std::string& message);
};

class ConfigException : public MessagingException {
public:
    explicit ConfigException(const std::string& message);
};

// Utility function declarations
std::string exchangeTypeToString(ExchangeType type);
ExchangeType stringToExchangeType(const std::string& str);
std::string connectionStateToString(ConnectionState state);
std::string errorTypeToString(ErrorType type);
std::string handlerOutcomeToString(HandlerOutcome outcome);

} // namespace broker_messaging
