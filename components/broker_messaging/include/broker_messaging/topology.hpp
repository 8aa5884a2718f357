#pragma once

#include <string>
#include "broker_messaging/broker.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

// Topic-exchange matching: words are separated by '.', '*' matches exactly
// one word and '#' matches zero or more words.
bool topicMatches(const std::string& pattern, const std::string& routingKey);

// Primary work queue: durable, dead-lettering to the configured exchange with the configured TTL
QueueDeclaration primaryQueueFor(const ConsumerConfig& config);

// Dead-letter exchange is fanout so every rejected routing key reaches the DLQ
ExchangeDeclaration deadLetterExchangeFor(const std::string& name);

QueueDeclaration deadLetterQueueFor(const DeadLetterConfig& config);

} // namespace broker_messaging
