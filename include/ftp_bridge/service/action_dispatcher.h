/**
 * @file action_dispatcher.h
 * @brief Routes decoded commands to handlers and always answers
 */

#ifndef FTP_BRIDGE_SERVICE_ACTION_DISPATCHER_H
#define FTP_BRIDGE_SERVICE_ACTION_DISPATCHER_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <ftp_bridge/broker/message_broker.h>
#include <ftp_bridge/engine/transfer_engine.h>
#include <ftp_bridge/ftp/connection_manager.h>
#include <ftp_bridge/history/history_sink.h>
#include <ftp_bridge/protocol/envelope.h>
#include <ftp_bridge/protocol/response_builder.h>
#include <ftp_bridge/registry/peripheral_registry.h>
#include <ftp_bridge/service/action_table.h>

namespace ftp_bridge {

/**
 * @brief Per-peripheral command dispatcher
 *
 * dispatch() handles one inbound message completely: decode, resolve the
 * action code, run the handler against this dispatcher's peripheral, and
 * publish the response(s). Every message yields exactly one terminal
 * envelope whose data.index is the command's. Handler failures, including
 * exceptions, become ERROR envelopes; dispatch() itself never throws.
 *
 * The peripheral record is looked up in the registry for every command and
 * dropped afterwards.
 */
class action_dispatcher {
public:
    struct collaborators {
        const peripheral_registry& registry;
        message_broker& broker;
        std::shared_ptr<history_sink> history;
        std::shared_ptr<session_factory> sessions;
    };

    action_dispatcher(int32_t peripheral_index,
                      collaborators deps,
                      action_table table,
                      connection_options connection,
                      engine_options engine,
                      response_builder builder = response_builder{});

    action_dispatcher(const action_dispatcher&) = delete;
    auto operator=(const action_dispatcher&) -> action_dispatcher& = delete;

    void dispatch(std::string_view raw);

    [[nodiscard]] auto peripheral_index() const -> int32_t { return index_; }

    /**
     * @brief Queue used when a command carries no redirect
     */
    [[nodiscard]] auto default_outbound() const -> std::string;

    [[nodiscard]] auto table() const -> const action_table& { return table_; }

private:
    void run_streamed(handler_id handler, const command_envelope& command,
                      const peripheral_ref& peripheral, const std::string& destination);

    [[nodiscard]] auto run_transfer(handler_id handler, const command_envelope& command,
                                    const peripheral_ref& peripheral,
                                    const progress_callback& on_progress,
                                    const started_callback& on_started)
        -> result<transfer_summary>;

    [[nodiscard]] auto run_listing(handler_id handler, const command_envelope& command,
                                   const peripheral_ref& peripheral) -> result<response_envelope>;

    [[nodiscard]] auto resolve_local(const peripheral_ref& peripheral,
                                     const std::string& path) const -> std::string;
    [[nodiscard]] auto resolve_remote(const peripheral_ref& peripheral,
                                      const std::string& path) const -> std::string;

    void reply_error(const command_envelope& command, const std::string& destination,
                     std::string_view operation, const error& err);
    void record(std::string_view operation, const response_envelope& terminal, bool success);

    int32_t index_;
    const peripheral_registry& registry_;
    message_broker& broker_;
    std::shared_ptr<history_sink> history_;
    action_table table_;
    response_builder builder_;
    connection_manager connections_;
    transfer_engine engine_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_SERVICE_ACTION_DISPATCHER_H
