/**
 * @file connection_manager.cpp
 * @brief Control-connection lifecycle, scoped cwd and transfer retry
 */

#include <ftp_bridge/ftp/connection_manager.h>

#include <thread>

#include <ftp_bridge/core/error_codes.h>
#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/path_utils.h>

namespace ftp_bridge {

namespace {

auto server_label(const peripheral_ref& p) -> std::string {
    return p.server.host + ":" + std::to_string(p.server.port);
}

}  // namespace

// ============================================================================
// peripheral_connection
// ============================================================================

peripheral_connection::peripheral_connection(session_factory& factory,
                                             peripheral_ref peripheral,
                                             connection_options options)
    : factory_(factory), peripheral_(std::move(peripheral)), options_(options) {}

peripheral_connection::~peripheral_connection() {
    close();
}

auto peripheral_connection::open() -> result<void> {
    session_ = factory_.create(peripheral_);
    if (!session_) {
        return unexpected{error{error_code::connection_error,
                                "No session available for peripheral " +
                                    std::to_string(peripheral_.index)}};
    }

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral_.index;
    ctx.server_address = server_label(peripheral_);

    auto connected = session_->connect();
    if (!connected) {
        ctx.error_message = connected.error().message;
        FB_LOG_ERROR_CTX(log_category::connection, "Connection failed", ctx);
        session_.reset();

        const bool refused = connected.error().code == error_code::login_failed;
        return unexpected{error{error_code::connection_error,
                                std::string(refused ? "Login failed for " : "Cannot connect to ") +
                                    server_label(peripheral_) + ": " +
                                    connected.error().message}};
    }

    FB_LOG_DEBUG_CTX(log_category::connection, "Connected", ctx);
    return {};
}

auto peripheral_connection::reconnect() -> result<void> {
    close();
    return open();
}

void peripheral_connection::close() {
    if (session_) {
        session_->close();
        session_.reset();
        FB_LOG_DEBUG(log_category::connection,
                     "Closed connection to peripheral " + std::to_string(peripheral_.index));
    }
}

auto peripheral_connection::session() -> ftp_session& {
    return *session_;
}

auto peripheral_connection::peripheral() const -> const peripheral_ref& {
    return peripheral_;
}

auto peripheral_connection::options() const -> const connection_options& {
    return options_;
}

auto peripheral_connection::retry_count() const -> std::size_t {
    return retries_;
}

auto peripheral_connection::run_with_retry(const std::string& what, const attempt_fn& attempt)
    -> result<void> {
    if (!session_) {
        if (auto opened = open(); !opened) {
            return opened;
        }
    }

    auto first = attempt(*session_);
    if (first || !is_transient(first.error().code)) {
        return first;
    }

    bridge_log_context ctx;
    ctx.peripheral_index = peripheral_.index;
    ctx.error_message = first.error().message;
    FB_LOG_WARN_CTX(log_category::connection, what + " interrupted, reconnecting once", ctx);

    if (options_.retry_delay.count() > 0) {
        std::this_thread::sleep_for(options_.retry_delay);
    }
    ++retries_;

    if (auto reopened = reconnect(); !reopened) {
        return unexpected{error{error_code::transfer_error,
                                what + " failed: " + first.error().message +
                                    "; reconnect failed: " + reopened.error().message}};
    }

    auto second = attempt(*session_);
    if (!second) {
        return unexpected{error{error_code::transfer_error,
                                what + " failed after retry: " + second.error().message}};
    }
    return {};
}

// ============================================================================
// connection_manager
// ============================================================================

connection_manager::connection_manager(std::shared_ptr<session_factory> factory,
                                       connection_options options)
    : factory_(std::move(factory)), options_(options) {}

auto connection_manager::open(const peripheral_ref& peripheral)
    -> result<std::unique_ptr<peripheral_connection>> {
    auto conn = std::make_unique<peripheral_connection>(*factory_, peripheral, options_);
    if (auto opened = conn->open(); !opened) {
        return unexpected{opened.error()};
    }
    return conn;
}

auto connection_manager::options() const -> const connection_options& {
    return options_;
}

// ============================================================================
// scoped_remote_directory
// ============================================================================

scoped_remote_directory::scoped_remote_directory(ftp_session& session) : session_(session) {}

scoped_remote_directory::~scoped_remote_directory() {
    if (!entered_ || previous_.empty() || !session_.is_open()) {
        return;
    }
    if (auto restored = session_.cwd(previous_); !restored) {
        FB_LOG_WARN(log_category::connection,
                    "Could not restore remote directory " + previous_ + ": " +
                        restored.error().message);
    }
}

auto scoped_remote_directory::enter(const std::string& path) -> result<void> {
    auto current = session_.pwd();
    if (current) {
        previous_ = current.value();
    }
    if (path.empty()) {
        entered_ = true;
        return {};
    }
    auto changed = session_.cwd(path);
    if (!changed) {
        return changed;
    }
    entered_ = true;
    return {};
}

// ============================================================================
// Path command helpers
// ============================================================================

auto with_parent_directory_fallback(
    ftp_session& session,
    const std::string& path,
    const std::function<result<void>(const std::string& target)>& op) -> result<void> {

    auto direct = op(path);
    if (direct) {
        return direct;
    }

    const auto code = direct.error().code;
    if (!is_remote_error(code)) {
        return direct;
    }

    auto parent = path_utils::parent(path);
    auto name = path_utils::basename(path);
    if (parent.empty() || name.empty()) {
        return direct;
    }

    FB_LOG_DEBUG(log_category::connection,
                 "Full-path command on " + path + " refused, retrying as " + name + " in " +
                     parent);

    scoped_remote_directory guard(session);
    if (auto entered = guard.enter(parent); !entered) {
        return direct;
    }
    return op(name);
}

auto ensure_remote_directory(ftp_session& session, const std::string& path) -> result<void> {
    auto norm = path_utils::normalize(path);
    if (norm.empty() || norm == "." || norm == "/") {
        return {};
    }

    std::string current = path_utils::is_absolute(norm) ? "/" : "";
    std::size_t start = path_utils::is_absolute(norm) ? 1 : 0;
    while (start <= norm.size()) {
        auto end = norm.find('/', start);
        if (end == std::string::npos) {
            end = norm.size();
        }
        auto component = norm.substr(start, end - start);
        start = end + 1;
        if (component.empty()) {
            continue;
        }

        current = path_utils::join(current, component);
        auto made = session.make_directory(current);
        if (!made) {
            if (is_transient(made.error().code)) {
                return made;
            }
            FB_LOG_TRACE(log_category::connection,
                         "MKD " + current + " refused: " + made.error().message);
        }
    }
    return {};
}

}  // namespace ftp_bridge
