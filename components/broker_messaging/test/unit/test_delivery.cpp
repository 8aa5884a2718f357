// test/unit/test_delivery.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "broker_messaging/delivery.hpp"

using namespace broker_messaging;
using ::testing::_;
using ::testing::Return;

namespace {

class MockBrokerChannel : public IBrokerChannel {
public:
    MOCK_METHOD(uint16_t, getId, (), (const, override));
    MOCK_METHOD(bool, isOpen, (), (const, override));
    MOCK_METHOD(Result<void>, declareExchange, (const ExchangeDeclaration& exchange), (override));
    MOCK_METHOD(Result<void>, declareQueue, (const QueueDeclaration& queue), (override));
    MOCK_METHOD(Result<void>, bindQueue, (const std::string& queue, const std::string& exchange,
                                          const std::string& routingKey), (override));
    MOCK_METHOD(Result<void>, setQos, (uint16_t prefetchCount), (override));
    MOCK_METHOD(Result<void>, enableConfirms, (), (override));
    MOCK_METHOD(Result<uint64_t>, publish, (const std::string& exchange, const Message& message), (override));
    MOCK_METHOD(ConfirmStatus, waitForConfirm, (uint64_t sequenceNumber, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(Result<std::string>, consume, (const std::string& queue, const std::string& consumerTag), (override));
    MOCK_METHOD(Result<void>, cancel, (const std::string& consumerTag), (override));
    MOCK_METHOD(std::optional<InboundDelivery>, nextDelivery, (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(Result<void>, ack, (uint64_t deliveryTag), (override));
    MOCK_METHOD(Result<void>, nack, (uint64_t deliveryTag, bool requeue), (override));
    MOCK_METHOD(Result<void>, reject, (uint64_t deliveryTag, bool requeue), (override));
    MOCK_METHOD(void, close, (), (override));
};

} // namespace

class DeliveryHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<::testing::NiceMock<MockBrokerChannel>>();
        ON_CALL(*channel_, isOpen()).WillByDefault(Return(true));
    }

    std::shared_ptr<::testing::NiceMock<MockBrokerChannel>> channel_;
};

TEST_F(DeliveryHandleTest, AckForwardsToChannel) {
    EXPECT_CALL(*channel_, ack(17)).WillOnce(Return(Result<void>()));

    DeliveryHandle handle(channel_, 17);
    EXPECT_FALSE(handle.isSettled());
    EXPECT_TRUE(handle.ack());
    EXPECT_TRUE(handle.isSettled());
}

TEST_F(DeliveryHandleTest, NackAndRejectPassRequeueFlag) {
    EXPECT_CALL(*channel_, nack(1, true)).WillOnce(Return(Result<void>()));
    EXPECT_CALL(*channel_, reject(2, false)).WillOnce(Return(Result<void>()));

    DeliveryHandle first(channel_, 1);
    DeliveryHandle second(channel_, 2);
    EXPECT_TRUE(first.nack(true));
    EXPECT_TRUE(second.reject(false));
}

TEST_F(DeliveryHandleTest, SecondSettlementFailsWithoutTouchingChannel) {
    EXPECT_CALL(*channel_, ack(5)).Times(1).WillOnce(Return(Result<void>()));

    DeliveryHandle handle(channel_, 5);
    EXPECT_TRUE(handle.ack());

    auto again = handle.ack();
    EXPECT_FALSE(again);
    EXPECT_EQ(ErrorType::ChannelError, again.error);
    EXPECT_FALSE(handle.nack(true));
    EXPECT_FALSE(handle.reject(false));
}

TEST_F(DeliveryHandleTest, ExpiredChannelFails) {
    std::weak_ptr<IBrokerChannel> weak;
    {
        auto temporary = std::make_shared<::testing::NiceMock<MockBrokerChannel>>();
        weak = temporary;
    }

    DeliveryHandle handle(weak, 9);
    auto result = handle.ack();
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
}

TEST_F(DeliveryHandleTest, ClosedChannelFails) {
    ON_CALL(*channel_, isOpen()).WillByDefault(Return(false));
    EXPECT_CALL(*channel_, nack(_, _)).Times(0);

    DeliveryHandle handle(channel_, 4);
    auto result = handle.nack(true);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
}

TEST_F(DeliveryHandleTest, ChannelFailureIsReturned) {
    EXPECT_CALL(*channel_, ack(3)).WillOnce(Return(Result<void>(ErrorType::ChannelError, "Channel closed")));

    DeliveryHandle handle(channel_, 3);
    auto result = handle.ack();
    EXPECT_FALSE(result);
    EXPECT_EQ("Channel closed", result.message);
}
