/**
 * @file action_dispatcher.cpp
 * @brief Action dispatcher implementation
 */

#include <ftp_bridge/service/action_dispatcher.h>

#include <exception>
#include <filesystem>

#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/path_utils.h>
#include <ftp_bridge/listing/file_entry.h>
#include <ftp_bridge/listing/local_listing.h>
#include <ftp_bridge/listing/remote_listing.h>

namespace ftp_bridge {

namespace {

auto missing(std::string_view what) -> unexpected {
    return unexpected{error{error_code::invalid_payload, std::string(what) + " is required"}};
}

/**
 * @brief Second path of a transfer payload; a bare-string payload has none
 */
auto secondary_path(const Json::Value& value, std::string_view key) -> result<std::string> {
    if (!value.isObject()) {
        return std::string{};
    }
    auto field = payload_optional_string(value, key);
    if (!field) {
        return unexpected{field.error()};
    }
    return field.value().value_or(std::string{});
}

auto success_value() -> Json::Value {
    Json::Value value(Json::objectValue);
    value["success"] = true;
    return value;
}

auto file_tree_value(Json::Value files) -> Json::Value {
    auto value = success_value();
    value["files"] = std::move(files);
    return value;
}

}  // namespace

action_dispatcher::action_dispatcher(int32_t peripheral_index,
                                     collaborators deps,
                                     action_table table,
                                     connection_options connection,
                                     engine_options engine,
                                     response_builder builder)
    : index_(peripheral_index),
      registry_(deps.registry),
      broker_(deps.broker),
      history_(std::move(deps.history)),
      table_(std::move(table)),
      builder_(std::move(builder)),
      connections_(std::move(deps.sessions), connection),
      engine_(connections_, engine) {}

auto action_dispatcher::default_outbound() const -> std::string {
    auto peripheral = registry_.find(index_);
    return peripheral ? peripheral.value().outbound() : default_outbound_queue(index_);
}

void action_dispatcher::dispatch(std::string_view raw) {
    auto decoded = decode_command(raw);
    if (!decoded) {
        command_envelope fallback;
        fallback.index = index_;
        reply_error(fallback, default_outbound(), "malformed_envelope", decoded.error());
        return;
    }
    const auto& command = decoded.value();

    bridge_log_context ctx;
    ctx.peripheral_index = command.index;
    ctx.action = command.action;
    FB_LOG_DEBUG_CTX(log_category::dispatcher, "Command received", ctx);

    if (command.index != index_) {
        FB_LOG_WARN_CTX(log_category::dispatcher,
                        "Command index differs from worker peripheral " +
                            std::to_string(index_) + "; running on the worker peripheral",
                        ctx);
    }

    auto peripheral = registry_.find(index_);
    const auto default_queue =
        peripheral ? peripheral.value().outbound() : default_outbound_queue(index_);
    const auto destination = response_builder::destination(command, default_queue);

    auto handler = table_.resolve(command.action);
    if (!handler) {
        reply_error(command, destination, "unknown_action",
                    error{error_code::unknown_action,
                          "Unknown action code " + std::to_string(command.action)});
        return;
    }
    const auto operation = to_string(*handler);

    if (!peripheral) {
        reply_error(command, destination, operation, peripheral.error());
        return;
    }

    if (is_streamed(*handler)) {
        run_streamed(*handler, command, peripheral.value(), destination);
        return;
    }

    result<response_envelope> response =
        unexpected{error{error_code::internal_error, "handler did not run"}};
    try {
        response = run_listing(*handler, command, peripheral.value());
    } catch (const std::exception& e) {
        response = unexpected{error{error_code::internal_error,
                                    std::string("Unhandled exception: ") + e.what()}};
    } catch (...) {
        response =
            unexpected{error{error_code::internal_error, "Unhandled non-standard exception"}};
    }

    if (!response) {
        reply_error(command, destination, operation, response.error());
        return;
    }

    if (auto published = publish_response(broker_, destination, response.value()); !published) {
        FB_LOG_WARN_CTX(log_category::dispatcher, "Response lost", ctx);
    }
    record(operation, response.value(), true);
}

void action_dispatcher::run_streamed(handler_id handler,
                                     const command_envelope& command,
                                     const peripheral_ref& peripheral,
                                     const std::string& destination) {
    const bool upload = handler == handler_id::upload_file || handler == handler_id::upload_directory;
    transfer_notifier notifier(broker_, builder_, command, destination,
                               upload ? upload_stream_codes : download_stream_codes);

    auto on_progress = [&notifier](const progress_record& record) { notifier.progress(record); };
    auto on_started = [&notifier] { notifier.start(); };

    result<transfer_summary> done =
        unexpected{error{error_code::internal_error, "handler did not run"}};
    try {
        done = run_transfer(handler, command, peripheral, on_progress, on_started);
    } catch (const std::exception& e) {
        done = unexpected{error{error_code::internal_error,
                                std::string("Unhandled exception: ") + e.what()}};
    } catch (...) {
        done = unexpected{error{error_code::internal_error, "Unhandled non-standard exception"}};
    }

    bridge_log_context ctx;
    ctx.peripheral_index = command.index;
    ctx.action = command.action;
    ctx.queue = destination;
    if (done) {
        ctx.total_files = done.value().files_transferred;
        ctx.total_bytes = done.value().bytes_transferred;
        notifier.finish();
        FB_LOG_INFO_CTX(log_category::dispatcher,
                        std::string(to_string(handler)) + " finished", ctx);
    } else {
        ctx.error_message = done.error().message;
        notifier.fail(done.error());
        FB_LOG_ERROR_CTX(log_category::dispatcher,
                         std::string(to_string(handler)) + " failed", ctx);
    }

    if (notifier.terminal()) {
        record(to_string(handler), *notifier.terminal(), done.has_value());
    }
}

auto action_dispatcher::run_transfer(handler_id handler,
                                     const command_envelope& command,
                                     const peripheral_ref& peripheral,
                                     const progress_callback& on_progress,
                                     const started_callback& on_started)
    -> result<transfer_summary> {
    const auto& value = command.value;

    switch (handler) {
        case handler_id::upload_file:
        case handler_id::upload_directory: {
            auto local = payload_path(value, "local_path");
            if (!local) {
                return unexpected{local.error()};
            }
            if (local.value().empty()) {
                return missing("local_path");
            }
            auto remote = secondary_path(value, "remote_path");
            if (!remote) {
                return unexpected{remote.error()};
            }
            const std::filesystem::path source = resolve_local(peripheral, local.value());
            const auto target = resolve_remote(peripheral, remote.value());
            if (handler == handler_id::upload_file) {
                return engine_.upload_file(peripheral, source, target, on_progress, on_started);
            }
            return engine_.upload_directory(peripheral, source, target, on_progress, on_started);
        }

        case handler_id::download_file:
        case handler_id::download_directory: {
            auto remote = payload_path(value, "remote_path");
            if (!remote) {
                return unexpected{remote.error()};
            }
            if (handler == handler_id::download_file && remote.value().empty()) {
                return missing("remote_path");
            }
            auto local = secondary_path(value, "local_path");
            if (!local) {
                return unexpected{local.error()};
            }
            const auto source = resolve_remote(peripheral, remote.value());
            const std::filesystem::path target = resolve_local(peripheral, local.value());
            if (handler == handler_id::download_file) {
                return engine_.download_file(peripheral, source, target, on_progress, on_started);
            }
            return engine_.download_directory(peripheral, source, target, on_progress, on_started);
        }

        default:
            return unexpected{error{error_code::internal_error,
                                    std::string(to_string(handler)) + " is not a transfer"}};
    }
}

auto action_dispatcher::run_listing(handler_id handler,
                                    const command_envelope& command,
                                    const peripheral_ref& peripheral)
    -> result<response_envelope> {
    const auto& value = command.value;

    switch (handler) {
        case handler_id::list_local: {
            auto path = payload_path(value, "local_path");
            if (!path) {
                return unexpected{path.error()};
            }
            auto entries = list_local(resolve_local(peripheral, path.value()));
            if (!entries) {
                return unexpected{entries.error()};
            }
            return builder_.make(
                action_code::server_file_tree, command,
                file_tree_value(to_json(without_hidden(std::move(entries.value())),
                                        entry_format::local)));
        }

        case handler_id::list_remote: {
            auto path = payload_path(value, "remote_path");
            if (!path) {
                return unexpected{path.error()};
            }
            const auto target = resolve_remote(peripheral, path.value());
            auto listing = connections_.with_connection(
                peripheral, [&](peripheral_connection& conn) {
                    return list_remote(conn.session(), target);
                });
            if (!listing) {
                return unexpected{listing.error()};
            }
            return builder_.make(
                action_code::client_file_tree, command,
                file_tree_value(to_json(without_hidden(std::move(listing.value().entries)),
                                        entry_format::remote)));
        }

        case handler_id::delete_file:
        case handler_id::delete_directory: {
            auto path = payload_path(value, "remote_path");
            if (!path) {
                return unexpected{path.error()};
            }
            if (path.value().empty()) {
                return missing("remote_path");
            }
            const auto target = resolve_remote(peripheral, path.value());
            auto deleted = connections_.with_connection(
                peripheral, [&](peripheral_connection& conn) -> result<void> {
                    if (handler == handler_id::delete_file) {
                        return engine_.delete_remote_file(conn, target);
                    }
                    auto removed = engine_.delete_remote_path(conn, target);
                    if (!removed) {
                        return unexpected{removed.error()};
                    }
                    return {};
                });
            if (!deleted) {
                return unexpected{deleted.error()};
            }
            return builder_.make(command.action, command, success_value());
        }

        case handler_id::list_peripherals: {
            Json::Value peripherals(Json::arrayValue);
            for (const auto& p : registry_.list()) {
                Json::Value item(Json::objectValue);
                item["index"] = p.index;
                item["name"] = p.name;
                item["host"] = p.server.host;
                item["port"] = p.server.port;
                item["use_tls"] = p.use_tls;
                peripherals.append(std::move(item));
            }
            auto listed = success_value();
            listed["peripherals"] = std::move(peripherals);
            return builder_.make(action_code::list_peripherals, command, std::move(listed));
        }

        default:
            return unexpected{error{error_code::internal_error,
                                    std::string(to_string(handler)) + " is a transfer"}};
    }
}

auto action_dispatcher::resolve_local(const peripheral_ref& peripheral,
                                      const std::string& path) const -> std::string {
    if (path.empty()) {
        return peripheral.local_root;
    }
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute() || peripheral.local_root.empty()) {
        return path;
    }
    return (std::filesystem::path(peripheral.local_root) / candidate).string();
}

auto action_dispatcher::resolve_remote(const peripheral_ref& peripheral,
                                       const std::string& path) const -> std::string {
    const auto& root = peripheral.remote_root;
    if (path.empty()) {
        // Trailing '/' keeps the root a directory target for uploads
        return root.empty() ? std::string{} : root + "/";
    }
    if (path_utils::is_absolute(path) || root.empty()) {
        return path;
    }
    auto joined = path_utils::join(root, path);
    if (path_utils::is_directory_like(path)) {
        joined += "/";
    }
    return joined;
}

void action_dispatcher::reply_error(const command_envelope& command,
                                    const std::string& destination,
                                    std::string_view operation,
                                    const error& err) {
    auto response = builder_.make_error(action_code::error, command, err);

    bridge_log_context ctx;
    ctx.peripheral_index = command.index;
    ctx.action = command.action;
    ctx.queue = destination;
    ctx.error_message = err.message;
    FB_LOG_ERROR_CTX(log_category::dispatcher, std::string(operation) + " failed", ctx);

    if (auto published = publish_response(broker_, destination, response); !published) {
        FB_LOG_WARN_CTX(log_category::dispatcher, "Error response lost", ctx);
    }
    record(operation, response, false);
}

void action_dispatcher::record(std::string_view operation,
                               const response_envelope& terminal,
                               bool success) {
    if (!history_) {
        return;
    }
    history_record entry{std::string(operation), success ? "success" : "error", to_json(terminal),
                         terminal.timestamp};
    if (auto written = history_->record(entry); !written) {
        FB_LOG_WARN(log_category::history,
                    "History record dropped: " + written.error().message);
    }
}

}  // namespace ftp_bridge
