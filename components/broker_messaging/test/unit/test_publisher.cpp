// test/unit/test_publisher.cpp
#include <gtest/gtest.h>
#include "broker_messaging/publisher.hpp"
#include "utils/fake_broker.hpp"
#include "utils/test_utils.hpp"
#include <future>
#include <thread>

using namespace broker_messaging;
using namespace broker_messaging::test;

class PublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<FakeBroker>();
        manager_ = std::make_shared<ConnectionManager>(TestConfig::getTestConnectionConfig(), broker_);
        config_ = TestConfig::getTestPublisherConfig();

        // A queue that catches everything published to the exchange
        broker_->declareExchange(config_.exchange, ExchangeType::Topic);
        QueueDeclaration sink;
        sink.name = "sink";
        broker_->declareQueue(sink);
        broker_->bindQueue("sink", config_.exchange, "#");
    }

    std::unique_ptr<Publisher> makePublisher() {
        return std::make_unique<Publisher>(manager_, config_);
    }

    std::shared_ptr<FakeBroker> broker_;
    std::shared_ptr<ConnectionManager> manager_;
    PublisherConfig config_;
};

TEST_F(PublisherTest, PublishIsConfirmed) {
    auto publisher = makePublisher();
    auto result = publisher->publish(TestMessages::createOrderMessage());

    ASSERT_TRUE(result) << result.message;
    EXPECT_FALSE(result.value.messageId.empty());
    EXPECT_EQ(1u, broker_->queueDepth("sink"));

    auto stats = publisher->getStats();
    EXPECT_EQ(1u, stats.messagesPublished);
    EXPECT_EQ(1u, stats.messagesConfirmed);
    EXPECT_EQ(0u, stats.publishFailed);
}

TEST_F(PublisherTest, StampsOutboundMetadata) {
    auto publisher = makePublisher();
    ASSERT_TRUE(publisher->publish(TestMessages::createOrderMessage("orders.created", 42)));

    auto stored = broker_->messagesIn("sink");
    ASSERT_EQ(1u, stored.size());
    const Message& message = stored[0];
    EXPECT_EQ("orders.created", message.getRoutingKey());
    EXPECT_FALSE(message.getMessageId().empty());
    EXPECT_EQ(0, message.getAttemptCount());
    EXPECT_EQ("test-service", message.getSourceService());
    EXPECT_TRUE(message.isPersistent());
    EXPECT_NE(0, message.getTimestamp().time_since_epoch().count());
    EXPECT_EQ(42, message.getPayloadJson()["orderId"].get<int>());
}

TEST_F(PublisherTest, KeepsCallerMessageId) {
    auto publisher = makePublisher();
    Message message = TestMessages::createOrderMessage();
    message.setMessageId("order-1-created");

    auto result = publisher->publish(message);
    ASSERT_TRUE(result);
    EXPECT_EQ("order-1-created", result.value.messageId);
    EXPECT_EQ("order-1-created", broker_->messagesIn("sink")[0].getMessageId());
}

TEST_F(PublisherTest, PublishJsonBody) {
    auto publisher = makePublisher();
    auto result = publisher->publish("orders.shipped", nlohmann::json{{"orderId", 7}});

    ASSERT_TRUE(result);
    auto stored = broker_->messagesIn("sink");
    ASSERT_EQ(1u, stored.size());
    EXPECT_EQ("application/json", stored[0].getContentType());
    EXPECT_EQ(7, stored[0].getPayloadJson()["orderId"].get<int>());
}

TEST_F(PublisherTest, EmptyRoutingKeyRejected) {
    auto publisher = makePublisher();
    Message message;
    message.setPayload("{}");

    auto result = publisher->publish(message);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::PublishError, result.error);
    EXPECT_EQ(0, broker_->connectAttempts());
}

TEST_F(PublisherTest, BrokerNackIsPublishError) {
    broker_->setConfirmMode(FakeBroker::ConfirmMode::Nack);
    auto publisher = makePublisher();

    auto result = publisher->publish(TestMessages::createOrderMessage());
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::PublishError, result.error);
    EXPECT_EQ(1u, publisher->getStats().messagesNacked);
}

TEST_F(PublisherTest, MissingConfirmIsTimeout) {
    broker_->setConfirmMode(FakeBroker::ConfirmMode::Never);
    config_.confirmTimeout = std::chrono::milliseconds(100);
    auto publisher = makePublisher();

    auto started = std::chrono::steady_clock::now();
    auto result = publisher->publish(TestMessages::createOrderMessage());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::TimeoutError, result.error);
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::milliseconds(350));
    EXPECT_EQ(1u, publisher->getStats().confirmTimeouts);
}

TEST_F(PublisherTest, MissingExchangeClosesChannel) {
    config_.exchange = "does-not-exist";
    config_.declareExchange = false;
    auto publisher = makePublisher();

    auto result = publisher->publish(TestMessages::createOrderMessage());
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
    EXPECT_EQ(0u, broker_->openChannelCount());
}

TEST_F(PublisherTest, DeclaresExchangeWhenConfigured) {
    config_.exchange = "billing";
    auto publisher = makePublisher();

    ASSERT_TRUE(publisher->initialize());
    EXPECT_TRUE(broker_->hasExchange("billing"));
}

TEST_F(PublisherTest, ExchangeTypeMismatchFailsSetup) {
    config_.exchangeType = ExchangeType::Fanout;
    auto publisher = makePublisher();

    auto initialized = publisher->initialize();
    EXPECT_FALSE(initialized);
    EXPECT_EQ(ErrorType::SetupError, initialized.error);
}

TEST_F(PublisherTest, RecoversAfterBrokerRestart) {
    auto publisher = makePublisher();
    ASSERT_TRUE(publisher->publish(TestMessages::createOrderMessage("orders.created", 1)));

    broker_->simulateRestart();

    auto result = publisher->publish(TestMessages::createOrderMessage("orders.created", 2));
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(2u, publisher->getStats().channelsOpened);
    EXPECT_EQ(1u, manager_->getStats().reconnects);
}

TEST_F(PublisherTest, RecoversAfterChannelClose) {
    auto publisher = makePublisher();
    ASSERT_TRUE(publisher->publish(TestMessages::createOrderMessage()));

    broker_->closeAllChannels();

    ASSERT_TRUE(publisher->publish(TestMessages::createOrderMessage()));
    EXPECT_EQ(2u, broker_->queueDepth("sink"));
    EXPECT_EQ(0u, manager_->getStats().reconnects);
}

TEST_F(PublisherTest, AuthenticationFailureSurfaces) {
    broker_->rejectCredentials(true);
    auto publisher = makePublisher();

    auto result = publisher->publish(TestMessages::createOrderMessage());
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::AuthenticationError, result.error);
}

TEST_F(PublisherTest, BlockedPublishTimesOut) {
    config_.confirmTimeout = std::chrono::milliseconds(100);
    auto publisher = makePublisher();
    ASSERT_TRUE(publisher->initialize());

    broker_->simulateBlocked();
    auto result = publisher->publish(TestMessages::createOrderMessage());
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::TimeoutError, result.error);
    EXPECT_EQ(0u, broker_->queueDepth("sink"));
}

TEST_F(PublisherTest, BlockedPublishResumesWhenUnblocked) {
    config_.confirmTimeout = std::chrono::milliseconds(2000);
    auto publisher = makePublisher();
    ASSERT_TRUE(publisher->initialize());

    broker_->simulateBlocked();
    std::thread unblocker([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        broker_->simulateUnblocked();
    });

    auto result = publisher->publish(TestMessages::createOrderMessage());
    unblocker.join();
    EXPECT_TRUE(result) << result.message;
    EXPECT_EQ(1u, broker_->queueDepth("sink"));
}

TEST_F(PublisherTest, ConcurrentPublishes) {
    auto publisher = makePublisher();
    const int threads = 4;
    const int perThread = 25;

    std::vector<std::future<int>> results;
    for (int t = 0; t < threads; ++t) {
        results.push_back(std::async(std::launch::async, [&publisher, t] {
            int confirmed = 0;
            for (int i = 0; i < perThread; ++i) {
                if (publisher->publish(TestMessages::createOrderMessage("orders.created", t * perThread + i))) {
                    ++confirmed;
                }
            }
            return confirmed;
        }));
    }

    int total = 0;
    for (auto& result : results) {
        total += result.get();
    }
    EXPECT_EQ(threads * perThread, total);
    EXPECT_EQ(static_cast<size_t>(threads * perThread), broker_->queueDepth("sink"));
    EXPECT_EQ(1u, publisher->getStats().channelsOpened);
}

TEST_F(PublisherTest, ClosedPublisherFails) {
    auto publisher = makePublisher();
    publisher->close();

    auto result = publisher->publish(TestMessages::createOrderMessage());
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::PublishError, result.error);
}

TEST_F(PublisherTest, ErrorCallbackInvoked) {
    broker_->setConfirmMode(FakeBroker::ConfirmMode::Nack);
    auto publisher = makePublisher();
    std::string reported;
    publisher->setErrorCallback([&reported](const std::string& code, const std::string&, const std::string& context) {
        reported = code + "@" + context;
    });

    EXPECT_FALSE(publisher->publish(TestMessages::createOrderMessage()));
    EXPECT_EQ("PublishError@Publisher", reported);
}
