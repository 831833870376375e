/**
 * @file in_memory_broker.cpp
 * @brief In-process broker implementation
 */

#include <ftp_bridge/broker/in_memory_broker.h>

#include <ftp_bridge/core/logging.h>

namespace ftp_bridge {

auto in_memory_broker::publish(const std::string& queue, const std::string& payload)
    -> result<void> {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return unexpected{error{error_code::broker_error,
                                    "Broker is shut down; dropped message for " + queue}};
        }
        queues_[queue].push_back(payload);
    }
    cv_.notify_all();
    FB_LOG_TRACE(log_category::broker, "Published to " + queue);
    return {};
}

auto in_memory_broker::receive(const std::string& queue, std::chrono::milliseconds timeout)
    -> std::optional<std::string> {
    std::unique_lock lock(mutex_);
    // Only a shutdown that happens during the wait releases the receiver early.
    // Once closed, an empty queue waits out the timeout so polling loops keep
    // their cadence.
    const bool closed_on_entry = closed_;
    const bool ready = cv_.wait_for(lock, timeout, [&] {
        if (closed_ && !closed_on_entry) {
            return true;
        }
        auto it = queues_.find(queue);
        return it != queues_.end() && !it->second.empty();
    });
    if (!ready) {
        return std::nullopt;
    }
    auto it = queues_.find(queue);
    if (it == queues_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto message = std::move(it->second.front());
    it->second.pop_front();
    return message;
}

auto in_memory_broker::drain(const std::string& queue) -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    auto it = queues_.find(queue);
    if (it == queues_.end()) {
        return out;
    }
    out.assign(std::make_move_iterator(it->second.begin()),
               std::make_move_iterator(it->second.end()));
    it->second.clear();
    return out;
}

auto in_memory_broker::pending(const std::string& queue) const -> std::size_t {
    std::lock_guard lock(mutex_);
    auto it = queues_.find(queue);
    return it == queues_.end() ? 0 : it->second.size();
}

void in_memory_broker::shutdown() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

}  // namespace ftp_bridge
