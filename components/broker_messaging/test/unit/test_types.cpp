// test/unit/test_types.cpp
#include <gtest/gtest.h>
#include "broker_messaging/types.hpp"

using namespace broker_messaging;

TEST(TypesTest, ResultSuccess) {
    Result<int> result(42);
    EXPECT_TRUE(result);
    EXPECT_EQ(42, *result);
    EXPECT_EQ(ErrorType::None, result.error);
}

TEST(TypesTest, ResultFailure) {
    Result<int> result(ErrorType::TimeoutError, "no confirm");
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::TimeoutError, result.error);
    EXPECT_EQ("no confirm", result.message);

    Result<void> failed(ErrorType::ChannelError, "closed");
    EXPECT_FALSE(failed);
    EXPECT_TRUE(Result<void>());
}

TEST(TypesTest, ExchangeTypeConversion) {
    EXPECT_EQ("topic", exchangeTypeToString(ExchangeType::Topic));
    EXPECT_EQ("fanout", exchangeTypeToString(ExchangeType::Fanout));
    EXPECT_EQ(ExchangeType::Direct, stringToExchangeType("direct"));
    EXPECT_EQ(ExchangeType::Headers, stringToExchangeType("headers"));
    EXPECT_EQ(ExchangeType::Topic, stringToExchangeType("topic"));
    EXPECT_THROW(stringToExchangeType("drect"), ConfigException);
}

TEST(TypesTest, EnumToString) {
    EXPECT_EQ("Connected", connectionStateToString(ConnectionState::Connected));
    EXPECT_EQ("Blocked", connectionStateToString(ConnectionState::Blocked));
    EXPECT_EQ("AuthenticationError", errorTypeToString(ErrorType::AuthenticationError));
    EXPECT_EQ("DeadLetter", handlerOutcomeToString(HandlerOutcome::DeadLetter));
}

TEST(TypesTest, ExceptionsCarryErrorType) {
    try {
        throw AuthenticationException("refused");
    } catch (const MessagingException& e) {
        EXPECT_EQ(ErrorType::AuthenticationError, e.getErrorType());
        EXPECT_STREQ("refused", e.what());
    }

    EXPECT_THROW(throw SetupException("x"), MessagingException);
    EXPECT_EQ(ErrorType::ConfigError, ConfigException("x").getErrorType());
    EXPECT_EQ(ErrorType::ConnectionError, ConnectionException("x").getErrorType());
    EXPECT_EQ(ErrorType::SetupError, SetupException("x").getErrorType());
}

TEST(TypesTest, RetryPolicyDefaults) {
    RetryPolicy policy;
    EXPECT_EQ(3, policy.maxAttempts);
    EXPECT_EQ(std::chrono::milliseconds(1000), policy.initialDelay);
    EXPECT_EQ(std::chrono::milliseconds(10000), policy.maxDelay);
    EXPECT_DOUBLE_EQ(2.0, policy.multiplier);
}
