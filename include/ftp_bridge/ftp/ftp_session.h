/**
 * @file ftp_session.h
 * @brief FTP control-session abstraction
 *
 * The engine and listing services talk to peripherals only through this
 * interface, so a libcurl session and the in-memory test server are
 * interchangeable.
 */

#ifndef FTP_BRIDGE_FTP_FTP_SESSION_H
#define FTP_BRIDGE_FTP_FTP_SESSION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/registry/peripheral_registry.h>

namespace ftp_bridge {

/**
 * @brief Connection tuning shared by every session of a service
 */
struct connection_options {
    std::chrono::milliseconds connect_timeout{30000};
    /// A data or control read stalled this long fails with connection_timeout
    std::chrono::milliseconds io_timeout{60000};
    /// Pause before the single reconnect-and-retry of a transfer
    std::chrono::milliseconds retry_delay{1000};
    bool passive = true;
    bool verify_tls = false;
};

/**
 * @brief Pulls upload bytes; returns the count written, 0 at end of data
 */
using data_source = std::function<result<std::size_t>(std::span<std::byte>)>;

/**
 * @brief Receives download bytes as they arrive
 */
using data_sink = std::function<result<void>(std::span<const std::byte>)>;

/**
 * @brief One control connection to a peripheral
 *
 * Paths are passed as given: absolute paths start with '/', relative paths
 * resolve against the current working directory. Failures map onto
 * error_code as follows: rejected login -> login_failed, unreachable host
 * -> connection_error, dropped link -> connection_lost, stalled I/O ->
 * connection_timeout, 500/502 replies -> command_not_supported, 550 on a
 * file operation -> remote_file_not_found, other negative replies ->
 * remote_command_failed.
 */
class ftp_session {
public:
    ftp_session() = default;
    virtual ~ftp_session() = default;

    ftp_session(const ftp_session&) = delete;
    auto operator=(const ftp_session&) -> ftp_session& = delete;

    // ========================================================================
    // Connection
    // ========================================================================

    /**
     * @brief Connect (with TLS if configured) and log in
     */
    [[nodiscard]] virtual auto connect() -> result<void> = 0;

    /**
     * @brief Close the control connection; safe to call when closed
     */
    virtual void close() = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    // ========================================================================
    // Working directory
    // ========================================================================

    [[nodiscard]] virtual auto pwd() -> result<std::string> = 0;
    [[nodiscard]] virtual auto cwd(const std::string& path) -> result<void> = 0;

    // ========================================================================
    // Listings (raw lines, parsed by the listing service)
    // ========================================================================

    [[nodiscard]] virtual auto mlsd(const std::string& path)
        -> result<std::vector<std::string>> = 0;
    [[nodiscard]] virtual auto list(const std::string& path)
        -> result<std::vector<std::string>> = 0;

    // ========================================================================
    // Files and directories
    // ========================================================================

    [[nodiscard]] virtual auto size(const std::string& path) -> result<uint64_t> = 0;
    [[nodiscard]] virtual auto make_directory(const std::string& path) -> result<void> = 0;
    [[nodiscard]] virtual auto delete_file(const std::string& path) -> result<void> = 0;
    [[nodiscard]] virtual auto remove_directory(const std::string& path) -> result<void> = 0;

    /**
     * @brief STOR: stream @p source to @p path until it reports end of data
     */
    [[nodiscard]] virtual auto store(const std::string& path, const data_source& source)
        -> result<void> = 0;

    /**
     * @brief RETR: stream @p path into @p sink
     */
    [[nodiscard]] virtual auto retrieve(const std::string& path, const data_sink& sink)
        -> result<void> = 0;
};

/**
 * @brief Creates unconnected sessions for a peripheral
 */
class session_factory {
public:
    virtual ~session_factory() = default;

    [[nodiscard]] virtual auto create(const peripheral_ref& peripheral)
        -> std::unique_ptr<ftp_session> = 0;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_FTP_FTP_SESSION_H
