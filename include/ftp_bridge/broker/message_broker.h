/**
 * @file message_broker.h
 * @brief Queue-addressed message transport seam
 */

#ifndef FTP_BRIDGE_BROKER_MESSAGE_BROKER_H
#define FTP_BRIDGE_BROKER_MESSAGE_BROKER_H

#include <chrono>
#include <optional>
#include <string>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief Publish / receive by queue name
 *
 * Connection setup, queue declaration and reconnection of the broker link
 * belong to the implementation. Workers only move message bodies.
 * Implementations must allow concurrent calls from every worker thread.
 */
class message_broker {
public:
    virtual ~message_broker() = default;

    /**
     * @brief Publish @p payload to @p queue
     * @return broker_error if the message could not be handed over
     */
    [[nodiscard]] virtual auto publish(const std::string& queue, const std::string& payload)
        -> result<void> = 0;

    /**
     * @brief Take the next message of @p queue, waiting up to @p timeout
     * @return the message body, or nothing when the wait timed out or the
     *         broker is shutting down
     */
    [[nodiscard]] virtual auto receive(const std::string& queue,
                                       std::chrono::milliseconds timeout)
        -> std::optional<std::string> = 0;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_BROKER_MESSAGE_BROKER_H
