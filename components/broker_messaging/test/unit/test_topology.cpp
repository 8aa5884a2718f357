// test/unit/test_topology.cpp
#include <gtest/gtest.h>
#include "broker_messaging/topology.hpp"

using namespace broker_messaging;

TEST(TopicMatchTest, ExactMatch) {
    EXPECT_TRUE(topicMatches("orders.created", "orders.created"));
    EXPECT_FALSE(topicMatches("orders.created", "orders.updated"));
    EXPECT_FALSE(topicMatches("orders.created", "orders.created.eu"));
}

TEST(TopicMatchTest, StarMatchesExactlyOneWord) {
    EXPECT_TRUE(topicMatches("orders.*", "orders.created"));
    EXPECT_FALSE(topicMatches("orders.*", "orders"));
    EXPECT_FALSE(topicMatches("orders.*", "orders.created.eu"));
    EXPECT_TRUE(topicMatches("*.created", "payments.created"));
}

TEST(TopicMatchTest, HashMatchesZeroOrMoreWords) {
    EXPECT_TRUE(topicMatches("orders.#", "orders"));
    EXPECT_TRUE(topicMatches("orders.#", "orders.created"));
    EXPECT_TRUE(topicMatches("orders.#", "orders.created.eu.west"));
    EXPECT_TRUE(topicMatches("#", "anything.at.all"));
    EXPECT_TRUE(topicMatches("#.eu", "orders.created.eu"));
    EXPECT_FALSE(topicMatches("#.eu", "orders.created.us"));
}

TEST(TopicMatchTest, MixedWildcards) {
    EXPECT_TRUE(topicMatches("*.orders.#", "eu.orders.created"));
    EXPECT_TRUE(topicMatches("*.orders.#", "eu.orders"));
    EXPECT_FALSE(topicMatches("*.orders.#", "orders.created"));
    EXPECT_TRUE(topicMatches("#.#", "a.b"));
}

TEST(TopologyTest, PrimaryQueueDeadLettersToConfiguredExchange) {
    ConsumerConfig config;
    config.queue = "billing.queue";
    config.deadLetterExchange = "events.dlx";
    config.messageTtl = std::chrono::milliseconds(30000);

    auto queue = primaryQueueFor(config);
    EXPECT_EQ("billing.queue", queue.name);
    EXPECT_TRUE(queue.durable);
    EXPECT_FALSE(queue.exclusive);
    EXPECT_EQ("events.dlx", queue.deadLetterExchange);
    EXPECT_EQ(std::chrono::milliseconds(30000), queue.messageTtl);
}

TEST(TopologyTest, DeadLetterExchangeIsDurableFanout) {
    auto exchange = deadLetterExchangeFor("events.dlx");
    EXPECT_EQ("events.dlx", exchange.name);
    EXPECT_EQ(ExchangeType::Fanout, exchange.type);
    EXPECT_TRUE(exchange.durable);
}

TEST(TopologyTest, DeadLetterQueueHasNoDeadLetterExchange) {
    DeadLetterConfig config;
    config.queue = "billing.dlq";
    auto queue = deadLetterQueueFor(config);
    EXPECT_EQ("billing.dlq", queue.name);
    EXPECT_TRUE(queue.durable);
    EXPECT_TRUE(queue.deadLetterExchange.empty());
}
