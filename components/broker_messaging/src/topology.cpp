#include "broker_messaging/topology.hpp"
#include <vector>

namespace broker_messaging {

namespace {

std::vector<std::string> splitWords(const std::string& value) {
    std::vector<std::string> words;
    size_t start = 0;
    while (true) {
        size_t dot = value.find('.', start);
        if (dot == std::string::npos) {
            words.push_back(value.substr(start));
            break;
        }
        words.push_back(value.substr(start, dot - start));
        start = dot + 1;
    }
    return words;
}

bool matchWords(const std::vector<std::string>& pattern, size_t p,
                const std::vector<std::string>& key, size_t k) {
    while (p < pattern.size()) {
        if (pattern[p] == "#") {
            // Collapse consecutive '#'
            while (p + 1 < pattern.size() && pattern[p + 1] == "#") {
                ++p;
            }
            if (p + 1 == pattern.size()) {
                return true;
            }
            for (size_t skip = k; skip <= key.size(); ++skip) {
                if (matchWords(pattern, p + 1, key, skip)) {
                    return true;
                }
            }
            return false;
        }
        if (k >= key.size()) {
            return false;
        }
        if (pattern[p] != "*" && pattern[p] != key[k]) {
            return false;
        }
        ++p;
        ++k;
    }
    return k == key.size();
}

} // namespace

bool topicMatches(const std::string& pattern, const std::string& routingKey) {
    if (pattern == "#") {
        return true;
    }
    auto patternWords = splitWords(pattern);
    auto keyWords = routingKey.empty() ? std::vector<std::string>{} : splitWords(routingKey);
    return matchWords(patternWords, 0, keyWords, 0);
}

QueueDeclaration primaryQueueFor(const ConsumerConfig& config) {
    QueueDeclaration queue;
    queue.name = config.queue;
    queue.durable = true;
    queue.deadLetterExchange = config.deadLetterExchange;
    queue.messageTtl = config.messageTtl;
    return queue;
}

ExchangeDeclaration deadLetterExchangeFor(const std::string& name) {
    ExchangeDeclaration exchange;
    exchange.name = name;
    exchange.type = ExchangeType::Fanout;
    exchange.durable = true;
    return exchange;
}

QueueDeclaration deadLetterQueueFor(const DeadLetterConfig& config) {
    QueueDeclaration queue;
    queue.name = config.queue;
    queue.durable = true;
    return queue;
}

} // namespace broker_messaging
