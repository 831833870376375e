/**
 * @file peripheral_worker.h
 * @brief Consumption loop of one peripheral
 */

#ifndef FTP_BRIDGE_SERVICE_PERIPHERAL_WORKER_H
#define FTP_BRIDGE_SERVICE_PERIPHERAL_WORKER_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <ftp_bridge/broker/message_broker.h>
#include <ftp_bridge/service/action_dispatcher.h>

namespace ftp_bridge {

/**
 * @brief Pulls commands from one inbound queue and dispatches them in order
 *
 * Each worker runs on its own thread with its own dispatcher, engine and
 * connection manager, so a slow peripheral never blocks another one. A
 * command in progress is not interrupted by stop(); the loop exits once it
 * finishes.
 */
class peripheral_worker {
public:
    peripheral_worker(std::string inbound_queue,
                      message_broker& broker,
                      std::unique_ptr<action_dispatcher> dispatcher,
                      std::chrono::milliseconds poll_interval);
    ~peripheral_worker();

    peripheral_worker(const peripheral_worker&) = delete;
    auto operator=(const peripheral_worker&) -> peripheral_worker& = delete;

    void start();

    /**
     * @brief Request the loop to exit and join its thread
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool { return running_.load(); }
    [[nodiscard]] auto processed() const -> std::size_t { return processed_.load(); }
    [[nodiscard]] auto inbound_queue() const -> const std::string& { return inbound_; }
    [[nodiscard]] auto dispatcher() -> action_dispatcher& { return *dispatcher_; }

private:
    void run();

    std::string inbound_;
    message_broker& broker_;
    std::unique_ptr<action_dispatcher> dispatcher_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> processed_{0};
    std::thread thread_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_SERVICE_PERIPHERAL_WORKER_H
