#include "broker_messaging/config.hpp"
#include "broker_messaging/logging.hpp"
#include "broker_messaging/messaging_runtime.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
namespace bm = broker_messaging;

// Global signal handler
std::atomic<bool> g_running(true);

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        po::options_description desc("Messaging service options");
        desc.add_options()
            ("help,h", "Print help message")
            ("service,s", po::value<std::string>()->default_value("example-service"), "Service name")
            ("config,c", po::value<std::string>(), "JSON configuration file (default: RABBITMQ_* environment)")
            ("bind,b", po::value<std::vector<std::string>>()->multitoken(), "Routing patterns to consume")
            ("publish,p", po::value<std::string>(), "Routing key to publish a heartbeat event to")
            ("interval,i", po::value<uint32_t>()->default_value(5), "Heartbeat interval in seconds")
            ("log-level,l", po::value<std::string>(), "Override the configured log level");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        const std::string serviceName = vm["service"].as<std::string>();
        bm::MessagingConfig config = vm.count("config")
            ? bm::Config::loadFromFile(vm["config"].as<std::string>())
            : bm::Config::loadFromEnvironment(serviceName);
        if (vm.count("log-level")) {
            config.logLevel = vm["log-level"].as<std::string>();
        }

        bm::configureLogging(config.serviceName, config.logLevel);

        bm::MessagingRuntime runtime(config);
        runtime.setErrorCallback([](const std::string& code, const std::string& message, const std::string& context) {
            spdlog::error("[{}] {} ({})", code, message, context);
        });
        runtime.start();

        if (vm.count("bind")) {
            auto patterns = vm["bind"].as<std::vector<std::string>>();
            runtime.addConsumer(patterns, [](const bm::Message& message) {
                spdlog::info("Received {} on '{}': {}", message.getMessageId(), message.getRoutingKey(),
                             message.getPayloadString());
                return bm::HandlerOutcome::Ack;
            });
        }

        const auto interval = std::chrono::seconds(vm["interval"].as<uint32_t>());
        auto nextPublish = std::chrono::steady_clock::now();
        uint64_t sequence = 0;

        // Run until signal received
        while (g_running) {
            if (vm.count("publish") && std::chrono::steady_clock::now() >= nextPublish) {
                nlohmann::json body = {
                    {"service", config.serviceName},
                    {"sequence", ++sequence}
                };
                auto result = runtime.publisher().publish(vm["publish"].as<std::string>(), body);
                if (result) {
                    spdlog::info("Published {} (confirmed in {}ms)", result.value.messageId,
                                 result.value.latency.count());
                } else {
                    spdlog::warn("Publish failed: {} - {}", bm::errorTypeToString(result.error), result.message);
                }
                nextPublish = std::chrono::steady_clock::now() + interval;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            if (!runtime.isHealthy()) {
                spdlog::critical("Messaging is unhealthy, exiting");
                break;
            }
        }

        runtime.shutdown();
        return g_running ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
