/**
 * @file peripheral_worker.cpp
 * @brief Peripheral worker implementation
 */

#include <ftp_bridge/service/peripheral_worker.h>

#include <ftp_bridge/core/logging.h>

namespace ftp_bridge {

peripheral_worker::peripheral_worker(std::string inbound_queue,
                                     message_broker& broker,
                                     std::unique_ptr<action_dispatcher> dispatcher,
                                     std::chrono::milliseconds poll_interval)
    : inbound_(std::move(inbound_queue)),
      broker_(broker),
      dispatcher_(std::move(dispatcher)),
      poll_interval_(poll_interval) {}

peripheral_worker::~peripheral_worker() {
    stop();
}

void peripheral_worker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    stop_requested_ = false;
    thread_ = std::thread([this] { run(); });

    bridge_log_context ctx;
    ctx.peripheral_index = dispatcher_->peripheral_index();
    ctx.queue = inbound_;
    FB_LOG_INFO_CTX(log_category::service, "Worker started", ctx);
}

void peripheral_worker::stop() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (running_.exchange(false)) {
        bridge_log_context ctx;
        ctx.peripheral_index = dispatcher_->peripheral_index();
        ctx.queue = inbound_;
        FB_LOG_INFO_CTX(log_category::service,
                        "Worker stopped after " + std::to_string(processed_.load()) + " commands",
                        ctx);
    }
}

void peripheral_worker::run() {
    while (!stop_requested_.load()) {
        auto message = broker_.receive(inbound_, poll_interval_);
        if (!message) {
            continue;
        }
        dispatcher_->dispatch(*message);
        ++processed_;
    }
}

}  // namespace ftp_bridge
