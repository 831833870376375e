/**
 * @file bridge_daemon.cpp
 * @brief Runs the bridge over an in-process broker fed from stdin
 *
 * This example demonstrates how to:
 * - Load a bridge configuration file
 * - Start one worker per configured peripheral
 * - Feed command envelopes and watch the responses
 *
 * Each stdin line is "<queue> <json>", for example:
 *   recv_queue_index_1 {"action":59,"data":{"index":1,"value":{"remote_path":"/"}}}
 * Every published response is printed as "<queue> <json>".
 */

#include <ftp_bridge/ftp_bridge.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>

using namespace ftp_bridge;

static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

/**
 * @brief Forwards to an in_memory_broker and echoes outbound traffic
 */
class echo_broker : public message_broker {
public:
    explicit echo_broker(std::set<std::string> inbound) : inbound_(std::move(inbound)) {}

    auto publish(const std::string& queue, const std::string& payload) -> result<void> override {
        if (inbound_.count(queue) == 0) {
            std::lock_guard lock(out_mutex_);
            std::cout << queue << " " << payload << std::endl;
        }
        return inner_.publish(queue, payload);
    }

    auto receive(const std::string& queue, std::chrono::milliseconds timeout)
        -> std::optional<std::string> override {
        return inner_.receive(queue, timeout);
    }

    void shutdown() { inner_.shutdown(); }

private:
    in_memory_broker inner_;
    std::set<std::string> inbound_;
    std::mutex out_mutex_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    auto config = load_bridge_config(argv[1]);
    if (!config) {
        std::cerr << "Failed to load configuration: " << config.error().message << std::endl;
        return 1;
    }
    apply_logging_config(config.value().logging);

    std::set<std::string> inbound;
    for (const auto& p : config.value().peripherals) {
        inbound.insert(p.inbound());
    }
    auto broker = std::make_shared<echo_broker>(inbound);

    auto service = bridge_service::builder()
        .with_config(config.value())
        .with_broker(broker)
        .build();
    if (!service) {
        std::cerr << "Failed to create bridge: " << service.error().message << std::endl;
        return 1;
    }

    if (auto started = service.value().start(); !started) {
        std::cerr << "Failed to start bridge: " << started.error().message << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "ftp_bridge " << version::to_string() << " running with "
              << service.value().worker_count() << " workers" << std::endl;

    std::string line;
    while (running && std::getline(std::cin, line)) {
        auto space = line.find(' ');
        if (line.empty() || space == std::string::npos) {
            std::cerr << "Expected '<queue> <json>'" << std::endl;
            continue;
        }
        if (auto sent = broker->publish(line.substr(0, space), line.substr(space + 1)); !sent) {
            std::cerr << sent.error().message << std::endl;
        }
    }

    // Let queued commands drain before shutdown
    std::this_thread::sleep_for(service.value().config().poll_interval * 2);
    service.value().stop();
    broker->shutdown();
    get_logger().shutdown();
    return 0;
}
