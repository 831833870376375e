/**
 * @file response_builder.h
 * @brief Shapes outcomes into response envelopes and publishes them
 */

#ifndef FTP_BRIDGE_PROTOCOL_RESPONSE_BUILDER_H
#define FTP_BRIDGE_PROTOCOL_RESPONSE_BUILDER_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <ftp_bridge/broker/message_broker.h>
#include <ftp_bridge/core/types.h>
#include <ftp_bridge/engine/transfer_types.h>
#include <ftp_bridge/protocol/action_codes.h>
#include <ftp_bridge/protocol/envelope.h>

namespace ftp_bridge {

/**
 * @brief Source of response timestamps, in unix seconds
 */
using clock_fn = std::function<int64_t()>;

[[nodiscard]] auto system_clock_seconds() -> int64_t;

/**
 * @brief Builds response envelopes for one command
 *
 * Every envelope carries the command's data.index and its extra, verbatim.
 */
class response_builder {
public:
    explicit response_builder(clock_fn clock = system_clock_seconds);

    /**
     * @brief Queue the command's responses go to
     * @return extra.send_to when present, otherwise @p default_queue
     */
    [[nodiscard]] static auto destination(const command_envelope& command,
                                          const std::string& default_queue) -> std::string;

    [[nodiscard]] auto make(int32_t action, const command_envelope& command,
                            Json::Value value) const -> response_envelope;

    [[nodiscard]] auto make(action_code action, const command_envelope& command,
                            Json::Value value) const -> response_envelope;

    /**
     * @brief Error envelope; value is {message, code, action}
     *
     * @param action Response code to emit (ERROR or ERROR_DOWNLOAD_FILE)
     * @param command The failed command; its code becomes value.action
     */
    [[nodiscard]] auto make_error(action_code action,
                                  const command_envelope& command,
                                  const error& err) const -> response_envelope;

    [[nodiscard]] auto now() const -> int64_t;

private:
    clock_fn clock_;
};

/**
 * @brief Encode and publish one envelope; failures are logged and returned
 */
[[nodiscard]] auto publish_response(message_broker& broker,
                                    const std::string& queue,
                                    const response_envelope& response) -> result<void>;

/**
 * @brief Notification stream of one streamed transfer
 *
 * Publishes START, PROGRESS records and exactly one terminal envelope
 * (FINISH or the failure code) to a single destination. start() and the
 * terminal calls take effect once; progress after the terminal envelope is
 * dropped.
 */
class transfer_notifier {
public:
    transfer_notifier(message_broker& broker,
                      const response_builder& builder,
                      const command_envelope& command,
                      std::string destination,
                      stream_codes codes);

    void start();
    void progress(const progress_record& record);
    void finish();
    void fail(const error& err);

    [[nodiscard]] auto started() const -> bool { return started_; }

    /**
     * @brief The terminal envelope, once sent
     */
    [[nodiscard]] auto terminal() const -> const std::optional<response_envelope>& {
        return terminal_;
    }

    [[nodiscard]] auto destination() const -> const std::string& { return destination_; }

private:
    void send(const response_envelope& response);

    message_broker& broker_;
    const response_builder& builder_;
    const command_envelope& command_;
    std::string destination_;
    stream_codes codes_;
    bool started_ = false;
    std::optional<response_envelope> terminal_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_PROTOCOL_RESPONSE_BUILDER_H
