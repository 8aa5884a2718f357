// src/message.cpp
#include "broker_messaging/message.hpp"
#include <random>
#include <sstream>

namespace broker_messaging {

Message::Message(std::string routingKey, std::vector<uint8_t> payload, std::string contentType)
    : routingKey_(std::move(routingKey)),
      payload_(std::move(payload)),
      contentType_(std::move(contentType)) {}

Message::Message(std::string routingKey, const std::string& payload, std::string contentType)
    : routingKey_(std::move(routingKey)),
      payload_(payload.begin(), payload.end()),
      contentType_(std::move(contentType)) {}

Message Message::fromJson(std::string routingKey, const nlohmann::json& body) {
    Message message(std::move(routingKey), body.dump(), "application/json");
    message.setTimestampNow();
    return message;
}

void Message::setPayload(const std::string& payload) {
    payload_.assign(payload.begin(), payload.end());
}

std::string Message::getPayloadString() const {
    return std::string(payload_.begin(), payload_.end());
}

nlohmann::json Message::getPayloadJson() const {
    return nlohmann::json::parse(payload_.begin(), payload_.end());
}

const std::string& Message::ensureMessageId() {
    if (messageId_.empty()) {
        messageId_ = generateMessageId();
    }
    return messageId_;
}

void Message::setTimestampNow() {
    timestamp_ = std::chrono::system_clock::now();
}

void Message::setHeader(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

std::optional<std::string> Message::getHeader(const std::string& name) const {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Message::hasHeader(const std::string& name) const {
    return headers_.find(name) != headers_.end();
}

void Message::removeHeader(const std::string& name) {
    headers_.erase(name);
}

int Message::getAttemptCount() const {
    return parseCount(getHeader(headers::AttemptCount));
}

void Message::setAttemptCount(int count) {
    setHeader(headers::AttemptCount, std::to_string(count));
}

int Message::getRepublishCount() const {
    return parseCount(getHeader(headers::RepublishCount));
}

void Message::setRepublishCount(int count) {
    setHeader(headers::RepublishCount, std::to_string(count));
}

std::string Message::getSourceService() const {
    return getHeader(headers::SourceService).value_or("");
}

void Message::setSourceService(const std::string& service) {
    setHeader(headers::SourceService, service);
}

Result<void> Message::validate() const {
    if (routingKey_.empty()) {
        return Result<void>(ErrorType::PublishError, "Routing key must not be empty");
    }
    return Result<void>();
}

Message Message::toOutbound() const {
    Message copy(*this);
    copy.deliveryTag_.reset();
    copy.exchange_.clear();
    copy.redelivered_ = false;
    return copy;
}

std::string Message::toString() const {
    std::ostringstream oss;
    oss << "Message{routingKey=" << routingKey_
        << ", messageId=" << messageId_
        << ", contentType=" << contentType_
        << ", payloadSize=" << payload_.size()
        << ", headers=" << headers_.size();
    if (deliveryTag_) {
        oss << ", deliveryTag=" << *deliveryTag_
            << ", redelivered=" << (redelivered_ ? "true" : "false");
    }
    oss << "}";
    return oss.str();
}

std::string Message::generateMessageId() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "msg-" << timestamp << "-" << std::hex << dis(gen);
    return oss.str();
}

int Message::parseCount(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return 0;
    }
    try {
        size_t consumed = 0;
        int count = std::stoi(*value, &consumed);
        return (consumed == value->size() && count > 0) ? count : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace broker_messaging
