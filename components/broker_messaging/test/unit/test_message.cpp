// test/unit/test_message.cpp
#include <gtest/gtest.h>
#include "broker_messaging/message.hpp"
#include "utils/test_utils.hpp"
#include <set>

using namespace broker_messaging;
using namespace broker_messaging::test;

class MessageTest : public ::testing::Test {
protected:
    void SetUp() override {
        message_ = TestMessages::createOrderMessage("orders.created", 7);
    }

    Message message_;
};

TEST_F(MessageTest, FromJsonSetsContentAndTimestamp) {
    EXPECT_EQ("orders.created", message_.getRoutingKey());
    EXPECT_EQ("application/json", message_.getContentType());
    EXPECT_NE(0, message_.getTimestamp().time_since_epoch().count());
    EXPECT_EQ(7, message_.getPayloadJson()["orderId"].get<int>());
    EXPECT_TRUE(message_.isPersistent());
}

TEST_F(MessageTest, StringPayloadRoundTrip) {
    Message message("audit.log", std::string("plain text"), "text/plain");
    EXPECT_EQ("plain text", message.getPayloadString());
    EXPECT_EQ(10u, message.getPayloadSize());
    EXPECT_EQ("text/plain", message.getContentType());
}

TEST_F(MessageTest, EnsureMessageIdIsStable) {
    EXPECT_TRUE(message_.getMessageId().empty());
    std::string id = message_.ensureMessageId();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(0u, id.find("msg-"));
    EXPECT_EQ(id, message_.ensureMessageId());
}

TEST_F(MessageTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(Message::generateMessageId());
    }
    EXPECT_EQ(1000u, ids.size());
}

TEST_F(MessageTest, HeaderAccess) {
    EXPECT_FALSE(message_.hasHeader("tenant"));
    EXPECT_FALSE(message_.getHeader("tenant").has_value());

    message_.setHeader("tenant", "acme");
    EXPECT_TRUE(message_.hasHeader("tenant"));
    EXPECT_EQ("acme", *message_.getHeader("tenant"));

    message_.removeHeader("tenant");
    EXPECT_FALSE(message_.hasHeader("tenant"));
}

TEST_F(MessageTest, WellKnownHeaders) {
    EXPECT_EQ(0, message_.getAttemptCount());
    EXPECT_EQ(0, message_.getRepublishCount());
    EXPECT_EQ("", message_.getSourceService());

    message_.setAttemptCount(2);
    message_.setRepublishCount(1);
    message_.setSourceService("orders");

    EXPECT_EQ(2, message_.getAttemptCount());
    EXPECT_EQ("2", *message_.getHeader(headers::AttemptCount));
    EXPECT_EQ(1, message_.getRepublishCount());
    EXPECT_EQ("orders", message_.getSourceService());
}

TEST_F(MessageTest, MalformedCountsReadAsZero) {
    message_.setHeader(headers::AttemptCount, "three");
    EXPECT_EQ(0, message_.getAttemptCount());
    message_.setHeader(headers::AttemptCount, "-4");
    EXPECT_EQ(0, message_.getAttemptCount());
    message_.setHeader(headers::AttemptCount, "5x");
    EXPECT_EQ(0, message_.getAttemptCount());
}

TEST_F(MessageTest, ValidateRequiresRoutingKey) {
    EXPECT_TRUE(message_.validate());

    Message empty("", std::string("{}"));
    auto result = empty.validate();
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::PublishError, result.error);
}

TEST_F(MessageTest, ToOutboundClearsInboundFields) {
    message_.ensureMessageId();
    message_.setDeliveryTag(42);
    message_.setExchange("events");
    message_.setRedelivered(true);
    message_.setCorrelationId("corr-1");
    EXPECT_TRUE(message_.isInbound());

    Message outbound = message_.toOutbound();
    EXPECT_FALSE(outbound.isInbound());
    EXPECT_TRUE(outbound.getExchange().empty());
    EXPECT_FALSE(outbound.isRedelivered());
    EXPECT_EQ(message_.getMessageId(), outbound.getMessageId());
    EXPECT_EQ("corr-1", outbound.getCorrelationId());
    EXPECT_EQ(message_.getPayload(), outbound.getPayload());
}

TEST_F(MessageTest, ToStringMentionsRoutingKey) {
    message_.setDeliveryTag(3);
    std::string text = message_.toString();
    EXPECT_NE(std::string::npos, text.find("orders.created"));
    EXPECT_NE(std::string::npos, text.find("deliveryTag=3"));
}
