// src/types.cpp
#include "broker_messaging/types.hpp"

namespace broker_messaging {

MessagingException::MessagingException(const std::string& message, ErrorType type)
    : std::runtime_error(message), errorType_(type) {}

ErrorType MessagingException::getErrorType() const noexcept {
    return errorType_;
}

ConnectionException::ConnectionException(const std::string& message)
    : MessagingException(message, ErrorType::ConnectionError) {}

AuthenticationException::AuthenticationException(const std::string& message)
    : MessagingException(message, ErrorType::AuthenticationError) {}

ChannelException::ChannelException(const std::string& message)
    : MessagingException(message, ErrorType::ChannelError) {}

TimeoutException::TimeoutException(const std::string& message)
    : MessagingException(message, ErrorType::TimeoutError) {}

PublishException::PublishException(const std::string& message)
    : MessagingException(message, ErrorType::PublishError) {}

SetupException::SetupException(const std::string& message)
    : MessagingException(message, ErrorType::SetupError) {}

ConfigException::ConfigException(const std::string& message)
    : MessagingException(message, ErrorType::ConfigError) {}

std::string exchangeTypeToString(ExchangeType type) {
    switch (type) {
        case ExchangeType::Direct: return "direct";
        case ExchangeType::Fanout: return "fanout";
        case ExchangeType::Topic: return "topic";
        case ExchangeType::Headers: return "headers";
        default: return "unknown";
    }
}

ExchangeType stringToExchangeType(const std::string& str) {
    if (str == "direct") return ExchangeType::Direct;
    if (str == "fanout") return ExchangeType::Fanout;
    if (str == "topic") return ExchangeType::Topic;
    if (str == "headers") return ExchangeType::Headers;
    throw ConfigException("Unknown exchange type '" + str + "', expected direct, fanout, topic or headers");
}

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Blocked: return "Blocked";
        case ConnectionState::ShuttingDown: return "ShuttingDown";
        default: return "Unknown";
    }
}

std::string errorTypeToString(ErrorType error) {
    switch (error) {
        case ErrorType::None: return "None";
        case ErrorType::ConnectionError: return "ConnectionError";
        case ErrorType::ChannelError: return "ChannelError";
        case ErrorType::AuthenticationError: return "AuthenticationError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::TimeoutError: return "TimeoutError";
        case ErrorType::PublishError: return "PublishError";
        case ErrorType::SetupError: return "SetupError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::ResourceError: return "ResourceError";
        default: return "Unknown";
    }
}

std::string handlerOutcomeToString(HandlerOutcome outcome) {
    switch (outcome) {
        case HandlerOutcome::Ack: return "Ack";
        case HandlerOutcome::Retry: return "Retry";
        case HandlerOutcome::DeadLetter: return "DeadLetter";
        default: return "Unknown";
    }
}

} // namespace broker_messaging
