/**
 * @file types.h
 * @brief Core type definitions for ftp_bridge
 */

#ifndef FTP_BRIDGE_CORE_TYPES_H
#define FTP_BRIDGE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ftp_bridge {

/**
 * @brief Error codes for bridge operations
 *
 * Ranges:
 * - -100 to -109: Envelope errors
 * - -110 to -119: Local filesystem errors
 * - -120 to -129: Connection errors
 * - -130 to -139: Remote protocol errors
 * - -140 to -149: Service errors
 */
enum class error_code {
    success = 0,

    // Envelope errors (-100 to -109)
    malformed_envelope = -100,
    invalid_payload = -101,
    unknown_action = -102,
    action_code_collision = -103,

    // Local filesystem errors (-110 to -119)
    path_not_found = -110,
    local_file_not_found = -111,
    permission_denied = -112,
    local_io_error = -113,

    // Connection errors (-120 to -129)
    connection_error = -120,
    login_failed = -121,
    connection_lost = -122,
    connection_timeout = -123,

    // Remote protocol errors (-130 to -139)
    transfer_error = -130,
    remote_file_not_found = -131,
    remote_list_error = -132,
    remote_delete_error = -133,
    command_not_supported = -134,
    remote_command_failed = -135,

    // Service errors (-140 to -149)
    peripheral_not_found = -140,
    invalid_configuration = -141,
    history_write_error = -142,
    broker_error = -143,

    // Internal errors
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::malformed_envelope:
            return "malformed envelope";
        case error_code::invalid_payload:
            return "invalid payload";
        case error_code::unknown_action:
            return "unknown action";
        case error_code::action_code_collision:
            return "action code collision";
        case error_code::path_not_found:
            return "path not found";
        case error_code::local_file_not_found:
            return "local file not found";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::local_io_error:
            return "local I/O error";
        case error_code::connection_error:
            return "connection error";
        case error_code::login_failed:
            return "login failed";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::transfer_error:
            return "transfer error";
        case error_code::remote_file_not_found:
            return "remote file not found";
        case error_code::remote_list_error:
            return "remote list error";
        case error_code::remote_delete_error:
            return "remote delete error";
        case error_code::command_not_supported:
            return "command not supported";
        case error_code::remote_command_failed:
            return "remote command failed";
        case error_code::peripheral_not_found:
            return "peripheral not found";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::history_write_error:
            return "history write error";
        case error_code::broker_error:
            return "broker error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Endpoint of a file-transfer peripheral
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : port(21) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_CORE_TYPES_H
