/**
 * @file in_memory_broker.h
 * @brief Process-local broker backed by per-queue FIFOs
 */

#ifndef FTP_BRIDGE_BROKER_IN_MEMORY_BROKER_H
#define FTP_BRIDGE_BROKER_IN_MEMORY_BROKER_H

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <ftp_bridge/broker/message_broker.h>

namespace ftp_bridge {

/**
 * @brief In-process broker
 *
 * Used by the daemon example and by tests. Messages of one queue are
 * delivered in publish order.
 */
class in_memory_broker : public message_broker {
public:
    in_memory_broker() = default;

    [[nodiscard]] auto publish(const std::string& queue, const std::string& payload)
        -> result<void> override;

    [[nodiscard]] auto receive(const std::string& queue, std::chrono::milliseconds timeout)
        -> std::optional<std::string> override;

    /**
     * @brief Remove and return every pending message of @p queue
     */
    [[nodiscard]] auto drain(const std::string& queue) -> std::vector<std::string>;

    [[nodiscard]] auto pending(const std::string& queue) const -> std::size_t;

    /**
     * @brief Wake all waiting receivers and refuse further publishes
     *
     * Messages already queued can still be received. A receive started
     * after shutdown on an empty queue blocks for its full timeout.
     */
    void shutdown();

private:
    std::map<std::string, std::deque<std::string>> queues_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_BROKER_IN_MEMORY_BROKER_H
