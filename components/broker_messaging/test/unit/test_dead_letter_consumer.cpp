// test/unit/test_dead_letter_consumer.cpp
#include <gtest/gtest.h>
#include "broker_messaging/dead_letter_consumer.hpp"
#include "utils/fake_broker.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <mutex>
#include <vector>

using namespace broker_messaging;
using namespace broker_messaging::test;

namespace {

std::string deathHeader(const std::string& queue, const std::string& routingKey, int count = 1) {
    nlohmann::json death = nlohmann::json::array();
    death.push_back({
        {"count", count},
        {"reason", "rejected"},
        {"queue", queue},
        {"exchange", "events"},
        {"routing-keys", {routingKey}}
    });
    return death.dump();
}

} // namespace

TEST(DeathHeaderTest, ParsesFirstEntry) {
    Message message = TestMessages::createOrderMessage();
    message.setHeader(headers::Death, deathHeader("test-service.queue", "orders.created", 3));

    DeathInfo info = parseDeathHeader(message);
    EXPECT_EQ("rejected", info.reason);
    EXPECT_EQ("test-service.queue", info.queue);
    EXPECT_EQ("events", info.exchange);
    EXPECT_EQ("orders.created", info.originalRoutingKey);
    EXPECT_EQ(3, info.count);
}

TEST(DeathHeaderTest, MissingHeader) {
    DeathInfo info = parseDeathHeader(TestMessages::createOrderMessage());
    EXPECT_TRUE(info.reason.empty());
    EXPECT_TRUE(info.originalRoutingKey.empty());
    EXPECT_EQ(0, info.count);
}

TEST(DeathHeaderTest, MalformedHeader) {
    Message message = TestMessages::createOrderMessage();

    message.setHeader(headers::Death, "{not json");
    EXPECT_TRUE(parseDeathHeader(message).queue.empty());

    message.setHeader(headers::Death, "[]");
    EXPECT_TRUE(parseDeathHeader(message).queue.empty());

    message.setHeader(headers::Death, "[42]");
    EXPECT_TRUE(parseDeathHeader(message).queue.empty());

    message.setHeader(headers::Death, R"([{"queue": 7, "routing-keys": "orders.created"}])");
    DeathInfo info = parseDeathHeader(message);
    EXPECT_TRUE(info.queue.empty());
    EXPECT_TRUE(info.originalRoutingKey.empty());
}

class DeadLetterConsumerTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<FakeBroker>();
        manager_ = std::make_shared<ConnectionManager>(TestConfig::getTestConnectionConfig(), broker_);
        config_ = TestConfig::getTestDeadLetterConfig();

        // Primary topology the republished messages return to
        broker_->declareExchange("events", ExchangeType::Topic);
        broker_->declareExchange("events.dlx", ExchangeType::Fanout);
        QueueDeclaration work;
        work.name = "test-service.queue";
        work.deadLetterExchange = "events.dlx";
        broker_->declareQueue(work);
        broker_->bindQueue("test-service.queue", "events", "orders.#");
    }

    void TearDown() override {
        if (consumer_) {
            consumer_->stop(std::chrono::seconds(2));
        }
    }

    void start() {
        consumer_ = std::make_unique<DeadLetterConsumer>(manager_, config_);
        consumer_->start();
    }

    // Delivers a message to the dead-letter queue the way the broker would
    void deadLetter(int orderId = 1, int republishCount = 0) {
        Message message = TestMessages::createOrderMessage("orders.created", orderId);
        message.setAttemptCount(3);
        if (republishCount > 0) {
            message.setRepublishCount(republishCount);
        }
        message.setHeader(headers::Death, deathHeader("test-service.queue", "orders.created"));
        broker_->publishDirect("events.dlx", message);
    }

    std::shared_ptr<FakeBroker> broker_;
    std::shared_ptr<ConnectionManager> manager_;
    DeadLetterConfig config_;
    std::unique_ptr<DeadLetterConsumer> consumer_;
};

TEST_F(DeadLetterConsumerTest, DeclaresDeadLetterTopology) {
    start();
    EXPECT_TRUE(consumer_->isRunning());
    EXPECT_TRUE(broker_->hasQueue("test-service.dlq"));
    EXPECT_EQ(1u, broker_->consumerCount("test-service.dlq"));
}

TEST_F(DeadLetterConsumerTest, LogsAndAcknowledgesByDefault) {
    std::mutex mutex;
    std::vector<DeathInfo> alerts;
    start();
    consumer_->setAlertCallback([&](const Message&, const DeathInfo& death) {
        std::lock_guard<std::mutex> lock(mutex);
        alerts.push_back(death);
    });

    deadLetter();

    ASSERT_TRUE(waitFor([this] { return consumer_->getStats().messagesDropped == 1; }));
    EXPECT_EQ(0u, broker_->queueDepth("test-service.dlq"));
    EXPECT_EQ(0u, broker_->queueDepth("test-service.queue"));
    EXPECT_EQ(0u, broker_->unackedCount());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(1u, alerts.size());
    EXPECT_EQ("orders.created", alerts[0].originalRoutingKey);
    EXPECT_EQ("test-service.queue", alerts[0].queue);
}

TEST_F(DeadLetterConsumerTest, ThrowingAlertStillAcknowledges) {
    start();
    consumer_->setAlertCallback([](const Message&, const DeathInfo&) {
        throw std::runtime_error("pager unavailable");
    });

    deadLetter();

    ASSERT_TRUE(waitFor([this] { return consumer_->getStats().messagesDropped == 1; }));
    EXPECT_EQ(0u, broker_->unackedCount());
    EXPECT_TRUE(consumer_->isHealthy());
}

TEST_F(DeadLetterConsumerTest, RepublishesToOriginalRoutingKey) {
    config_.republish = true;
    start();

    deadLetter(7);

    ASSERT_TRUE(waitFor([this] { return broker_->queueDepth("test-service.queue") == 1; }));
    auto messages = broker_->messagesIn("test-service.queue");
    ASSERT_EQ(1u, messages.size());
    const Message& republished = messages[0];
    EXPECT_EQ("orders.created", republished.getRoutingKey());
    EXPECT_EQ(1, republished.getRepublishCount());
    EXPECT_EQ(4, republished.getAttemptCount());
    EXPECT_FALSE(republished.hasHeader(headers::Death));
    EXPECT_EQ(7, republished.getPayloadJson()["orderId"].get<int>());

    EXPECT_EQ(1u, consumer_->getStats().messagesRepublished);
    EXPECT_TRUE(waitFor([this] { return broker_->queueDepth("test-service.dlq") == 0 &&
                                        broker_->unackedCount() == 0; }));
}

TEST_F(DeadLetterConsumerTest, NonStandardAlertExceptionStillAcknowledges) {
    start();
    consumer_->setAlertCallback([](const Message&, const DeathInfo&) {
        throw 42;
    });

    deadLetter();

    ASSERT_TRUE(waitFor([this] { return consumer_->getStats().messagesDropped == 1; }));
    EXPECT_EQ(0u, broker_->unackedCount());
    EXPECT_TRUE(consumer_->isRunning());
}

TEST_F(DeadLetterConsumerTest, RepublishCeilingIsTerminal) {
    config_.republish = true;
    config_.maxRepublishAttempts = 2;
    std::atomic<int> alerts{0};
    start();
    consumer_->setAlertCallback([&alerts](const Message&, const DeathInfo&) { ++alerts; });

    deadLetter(1, 2);

    ASSERT_TRUE(waitFor([&alerts] { return alerts.load() == 1; }));
    EXPECT_EQ(0u, broker_->queueDepth("test-service.queue"));
    EXPECT_EQ(0u, consumer_->getStats().messagesRepublished);
    EXPECT_EQ(1u, consumer_->getStats().messagesDropped);
}

TEST_F(DeadLetterConsumerTest, FailedRepublishIsRequeued) {
    config_.republish = true;
    config_.exchange = "missing-exchange";
    start();

    deadLetter();

    ASSERT_TRUE(waitFor([this] { return consumer_->getStats().republishFailures >= 1; }));
    consumer_->stop(std::chrono::seconds(2));
    EXPECT_EQ(0u, consumer_->getStats().messagesDropped);
    EXPECT_TRUE(waitFor([this] { return broker_->queueDepth("test-service.dlq") == 1; }));
}

TEST_F(DeadLetterConsumerTest, ReconnectsAfterBrokerRestart) {
    start();
    broker_->simulateRestart();

    ASSERT_TRUE(waitFor([this] { return broker_->consumerCount("test-service.dlq") == 1; }));
    deadLetter();
    ASSERT_TRUE(waitFor([this] { return consumer_->getStats().messagesDropped == 1; }));
}

TEST_F(DeadLetterConsumerTest, StartTwiceThrows) {
    start();
    EXPECT_THROW(consumer_->start(), SetupException);
}

TEST_F(DeadLetterConsumerTest, QueueRequired) {
    config_.queue.clear();
    consumer_ = std::make_unique<DeadLetterConsumer>(manager_, config_);
    EXPECT_THROW(consumer_->start(), SetupException);
}

TEST_F(DeadLetterConsumerTest, StopWithoutStart) {
    DeadLetterConsumer consumer(manager_, config_);
    EXPECT_NO_THROW(consumer.stop(std::chrono::milliseconds(10)));
    EXPECT_FALSE(consumer.isRunning());
}
