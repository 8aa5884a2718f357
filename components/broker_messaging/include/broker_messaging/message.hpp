#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "broker_messaging/types.hpp"

namespace broker_messaging {

using Headers = std::map<std::string, std::string>;

// Message envelope shared by outbound publishes and inbound deliveries.
// The payload is opaque bytes; headers carry correlation, source and retry metadata.
class Message {
public:
    Message() = default;
    Message(std::string routingKey, std::vector<uint8_t> payload,
            std::string contentType = "application/json");
    Message(std::string routingKey, const std::string& payload,
            std::string contentType = "application/json");

    static Message fromJson(std::string routingKey, const nlohmann::json& body);

    // Routing
    const std::string& getRoutingKey() const { return routingKey_; }
    void setRoutingKey(const std::string& routingKey) { routingKey_ = routingKey; }

    // Payload
    const std::vector<uint8_t>& getPayload() const { return payload_; }
    void setPayload(std::vector<uint8_t> payload) { payload_ = std::move(payload); }
    void setPayload(const std::string& payload);
    std::string getPayloadString() const;
    // Throws nlohmann::json::parse_error when the payload is not JSON
    nlohmann::json getPayloadJson() const;
    size_t getPayloadSize() const { return payload_.size(); }

    // Standard properties
    const std::string& getContentType() const { return contentType_; }
    void setContentType(const std::string& contentType) { contentType_ = contentType; }

    const std::string& getMessageId() const { return messageId_; }
    void setMessageId(const std::string& id) { messageId_ = id; }
    // Assigns a fresh id when none was set; returns the id in use
    const std::string& ensureMessageId();

    const std::string& getCorrelationId() const { return correlationId_; }
    void setCorrelationId(const std::string& id) { correlationId_ = id; }

    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }
    void setTimestamp(std::chrono::system_clock::time_point timestamp) { timestamp_ = timestamp; }
    void setTimestampNow();

    bool isPersistent() const { return persistent_; }
    void setPersistent(bool persistent) { persistent_ = persistent; }

    // Headers
    const Headers& getHeaders() const { return headers_; }
    void setHeaders(Headers headers) { headers_ = std::move(headers); }
    void setHeader(const std::string& name, const std::string& value);
    std::optional<std::string> getHeader(const std::string& name) const;
    bool hasHeader(const std::string& name) const;
    void removeHeader(const std::string& name);

    // Typed access to the well-known headers; malformed values read as 0
    int getAttemptCount() const;
    void setAttemptCount(int count);
    int getRepublishCount() const;
    void setRepublishCount(int count);
    std::string getSourceService() const;
    void setSourceService(const std::string& service);

    // Inbound-only fields, filled in by the transport
    const std::optional<uint64_t>& getDeliveryTag() const { return deliveryTag_; }
    void setDeliveryTag(uint64_t tag) { deliveryTag_ = tag; }
    bool isInbound() const { return deliveryTag_.has_value(); }

    const std::string& getExchange() const { return exchange_; }
    void setExchange(const std::string& exchange) { exchange_ = exchange; }

    bool isRedelivered() const { return redelivered_; }
    void setRedelivered(bool redelivered) { redelivered_ = redelivered; }

    // Outbound validation: a routing key is required
    Result<void> validate() const;

    // Copy suitable for publishing again: inbound-only fields are cleared
    Message toOutbound() const;

    std::string toString() const;

    static std::string generateMessageId();

private:
    static int parseCount(const std::optional<std::string>& value);

    std::string routingKey_;
    std::vector<uint8_t> payload_;
    std::string contentType_{"application/json"};
    std::string messageId_;
    std::string correlationId_;
    std::chrono::system_clock::time_point timestamp_{};
    bool persistent_{true};
    Headers headers_;

    std::optional<uint64_t> deliveryTag_;
    std::string exchange_;
    bool redelivered_{false};
};

} // namespace broker_messaging
