// benchmark/benchmark_publisher.cpp
#include <benchmark/benchmark.h>
#include "broker_messaging/attempt_store.hpp"
#include "broker_messaging/backoff.hpp"
#include "broker_messaging/message.hpp"
#include "broker_messaging/publisher.hpp"
#include "broker_messaging/topology.hpp"
#include "utils/fake_broker.hpp"
#include "utils/test_utils.hpp"
#include <spdlog/spdlog.h>

using namespace broker_messaging;
using namespace broker_messaging::test;

// Message creation benchmarks
static void BM_CreateJsonMessage(benchmark::State& state) {
    nlohmann::json body = {
        {"orderId", 123456},
        {"customer", "customer-123456"},
        {"items", {
            {{"sku", "A-100"}, {"quantity", 2}},
            {{"sku", "B-200"}, {"quantity", 1}}
        }},
        {"total", 59.97}
    };

    for (auto _ : state) {
        auto message = Message::fromJson("orders.created", body);
        message.ensureMessageId();
        benchmark::DoNotOptimize(message);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * body.dump().size());
}
BENCHMARK(BM_CreateJsonMessage);

static void BM_GenerateMessageId(benchmark::State& state) {
    for (auto _ : state) {
        auto id = Message::generateMessageId();
        benchmark::DoNotOptimize(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateMessageId);

static void BM_TopicMatch(benchmark::State& state) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"orders.*", "orders.created"},
        {"orders.#", "orders.eu.west.created"},
        {"#.created", "payments.card.created"},
        {"*.*.settled", "payments.card.refunded"}
    };

    size_t i = 0;
    for (auto _ : state) {
        const auto& entry = cases[i++ % cases.size()];
        bool matched = topicMatches(entry.first, entry.second);
        benchmark::DoNotOptimize(matched);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TopicMatch);

static void BM_BackoffDelay(benchmark::State& state) {
    RetryPolicy policy;
    int attempt = 1;
    for (auto _ : state) {
        auto delay = computeBackoffDelay(attempt, policy);
        benchmark::DoNotOptimize(delay);
        attempt = attempt % 10 + 1;
    }
}
BENCHMARK(BM_BackoffDelay);

static void BM_AttemptStoreIncrement(benchmark::State& state) {
    InMemoryAttemptStore store(static_cast<size_t>(state.range(0)));
    uint64_t counter = 0;

    for (auto _ : state) {
        auto result = store.increment("message-" + std::to_string(counter++ % 1000));
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AttemptStoreIncrement)->Arg(100)->Arg(10000);

// Confirmed publishes through the in-memory broker; measures the publisher's own overhead
static void BM_PublishConfirmed(benchmark::State& state) {
    auto broker = std::make_shared<FakeBroker>();
    broker->declareExchange("events", ExchangeType::Topic);

    auto manager = std::make_shared<ConnectionManager>(TestConfig::getTestConnectionConfig(), broker);
    Publisher publisher(manager, TestConfig::getTestPublisherConfig());
    if (!publisher.initialize()) {
        state.SkipWithError("Publisher initialization failed");
        return;
    }

    const auto body = TestMessages::createOrderData(1);
    for (auto _ : state) {
        auto result = publisher.publish("orders.created", body);
        if (!result) {
            state.SkipWithError(result.message.c_str());
            break;
        }
    }

    auto stats = publisher.getStats();
    state.counters["MessagesConfirmed"] = benchmark::Counter(static_cast<double>(stats.messagesConfirmed));
    state.counters["PublishFailed"] = benchmark::Counter(static_cast<double>(stats.publishFailed));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PublishConfirmed)->Threads(1)->Threads(4);

// Custom main function for benchmark configuration
int main(int argc, char** argv) {
    benchmark::Initialize(&argc, argv);

    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }

    // Reduce log noise during benchmarks
    spdlog::set_level(spdlog::level::warn);

    benchmark::AddCustomContext("Broker Messaging", "v0.1.0");
    benchmark::AddCustomContext("Build Type", CMAKE_BUILD_TYPE);
    benchmark::AddCustomContext("Compiler", CMAKE_CXX_COMPILER_ID);

    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
