/**
 * @file error_codes.h
 * @brief Error classification helpers for ftp_bridge
 *
 * The numeric ranges of error_code group errors by the layer that produced
 * them. These helpers let the connection manager and the dispatcher decide
 * what to retry and which response code to report.
 */

#ifndef FTP_BRIDGE_CORE_ERROR_CODES_H
#define FTP_BRIDGE_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief Check if error code is in envelope error range
 */
[[nodiscard]] constexpr auto is_envelope_error(error_code code) noexcept -> bool {
    const auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -109;
}

/**
 * @brief Check if error code is in local filesystem error range
 */
[[nodiscard]] constexpr auto is_local_error(error_code code) noexcept -> bool {
    const auto v = static_cast<int32_t>(code);
    return v <= -110 && v >= -119;
}

/**
 * @brief Check if error code is in connection error range
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept -> bool {
    const auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -129;
}

/**
 * @brief Check if error code is in remote protocol error range
 */
[[nodiscard]] constexpr auto is_remote_error(error_code code) noexcept -> bool {
    const auto v = static_cast<int32_t>(code);
    return v <= -130 && v >= -139;
}

/**
 * @brief Check if error code is in service error range
 */
[[nodiscard]] constexpr auto is_service_error(error_code code) noexcept -> bool {
    const auto v = static_cast<int32_t>(code);
    return v <= -140 && v >= -149;
}

/**
 * @brief Check if the error may clear up after a fresh reconnect
 *
 * Only a dropped or timed-out link qualifies. Login and connect failures
 * are not transient: credentials are stable within one operation.
 */
[[nodiscard]] constexpr auto is_transient(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::connection_lost:
        case error_code::connection_timeout:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Prefix an error message with context, keeping the code
 */
[[nodiscard]] inline auto with_context(const error& err, const std::string& context)
    -> error {
    return error{err.code, context + ": " + err.message};
}

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_CORE_ERROR_CODES_H
