/**
 * @file response_builder.cpp
 * @brief Response builder and transfer notifier implementation
 */

#include <ftp_bridge/protocol/response_builder.h>

#include <chrono>

#include <ftp_bridge/core/logging.h>

namespace ftp_bridge {

auto system_clock_seconds() -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// response_builder
// ============================================================================

response_builder::response_builder(clock_fn clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = system_clock_seconds;
    }
}

auto response_builder::destination(const command_envelope& command,
                                   const std::string& default_queue) -> std::string {
    if (auto redirect = command.send_to()) {
        return *redirect;
    }
    return default_queue;
}

auto response_builder::make(int32_t action,
                            const command_envelope& command,
                            Json::Value value) const -> response_envelope {
    response_envelope response;
    response.action = action;
    response.index = command.index;
    response.value = std::move(value);
    response.timestamp = now();
    response.extra = command.extra;
    return response;
}

auto response_builder::make(action_code action,
                            const command_envelope& command,
                            Json::Value value) const -> response_envelope {
    return make(to_int(action), command, std::move(value));
}

auto response_builder::make_error(action_code action,
                                  const command_envelope& command,
                                  const error& err) const -> response_envelope {
    Json::Value value(Json::objectValue);
    value["message"] = err.message.empty() ? std::string(to_string(err.code)) : err.message;
    value["code"] = static_cast<int>(err.code);
    value["action"] = command.action;
    return make(action, command, std::move(value));
}

auto response_builder::now() const -> int64_t {
    return clock_();
}

auto publish_response(message_broker& broker,
                      const std::string& queue,
                      const response_envelope& response) -> result<void> {
    auto published = broker.publish(queue, encode_response(response));
    if (!published) {
        bridge_log_context ctx;
        ctx.peripheral_index = response.index;
        ctx.action = response.action;
        ctx.queue = queue;
        ctx.error_message = published.error().message;
        FB_LOG_ERROR_CTX(log_category::broker, "Failed to publish response", ctx);
    }
    return published;
}

// ============================================================================
// transfer_notifier
// ============================================================================

transfer_notifier::transfer_notifier(message_broker& broker,
                                     const response_builder& builder,
                                     const command_envelope& command,
                                     std::string destination,
                                     stream_codes codes)
    : broker_(broker),
      builder_(builder),
      command_(command),
      destination_(std::move(destination)),
      codes_(codes) {}

void transfer_notifier::start() {
    if (started_ || terminal_) {
        return;
    }
    started_ = true;
    send(builder_.make(codes_.start, command_, Json::Value("")));
}

void transfer_notifier::progress(const progress_record& record) {
    if (terminal_) {
        return;
    }
    send(builder_.make(codes_.progress, command_, to_json(record)));
}

void transfer_notifier::finish() {
    if (terminal_) {
        return;
    }
    terminal_ = builder_.make(codes_.finish, command_, Json::Value(""));
    send(*terminal_);
}

void transfer_notifier::fail(const error& err) {
    if (terminal_) {
        return;
    }
    terminal_ = builder_.make_error(codes_.failure, command_, err);
    send(*terminal_);
}

void transfer_notifier::send(const response_envelope& response) {
    // A lost notification is logged by publish_response; the transfer goes on.
    auto published = publish_response(broker_, destination_, response);
    if (!published) {
        FB_LOG_WARN(log_category::dispatcher,
                    "Notification " + std::to_string(response.action) + " not delivered");
    }
}

}  // namespace ftp_bridge
