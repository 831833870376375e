/**
 * @file connection_manager.h
 * @brief Control-connection lifecycle for one operation
 *
 * @code
 * connection_manager connections(factory, options);
 * auto listed = connections.with_connection(peripheral, [&](peripheral_connection& conn) {
 *     return list_remote(conn.session(), "/jobs");
 * });
 * @endcode
 */

#ifndef FTP_BRIDGE_FTP_CONNECTION_MANAGER_H
#define FTP_BRIDGE_FTP_CONNECTION_MANAGER_H

#include <functional>
#include <memory>
#include <string>
#include <type_traits>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/ftp/ftp_session.h>

namespace ftp_bridge {

/**
 * @brief An authenticated session to one peripheral
 *
 * Owns its ftp_session and closes it on destruction, so every exit path of
 * the owning scope releases the control connection.
 */
class peripheral_connection {
public:
    using attempt_fn = std::function<result<void>(ftp_session&)>;

    peripheral_connection(session_factory& factory,
                          peripheral_ref peripheral,
                          connection_options options);
    ~peripheral_connection();

    peripheral_connection(const peripheral_connection&) = delete;
    auto operator=(const peripheral_connection&) -> peripheral_connection& = delete;

    /**
     * @brief Connect and log in
     * @return connection_error if the host is unreachable or the login is
     *         refused; never retried
     */
    [[nodiscard]] auto open() -> result<void>;

    /**
     * @brief Drop the current session and open a fresh one
     */
    [[nodiscard]] auto reconnect() -> result<void>;

    void close();

    [[nodiscard]] auto session() -> ftp_session&;
    [[nodiscard]] auto peripheral() const -> const peripheral_ref&;
    [[nodiscard]] auto options() const -> const connection_options&;

    /**
     * @brief Run a store/retrieve attempt with one retry on a transient error
     *
     * A connection_lost or connection_timeout failure is retried once after
     * retry_delay and a fresh reconnect. A second failure, or a failed
     * reconnect, is reported as transfer_error. Other errors are returned
     * unchanged.
     *
     * @param what Operation label for logs and error messages
     * @param attempt Called once per attempt; must restart from scratch
     */
    [[nodiscard]] auto run_with_retry(const std::string& what, const attempt_fn& attempt)
        -> result<void>;

    /**
     * @brief Number of reconnects performed by run_with_retry
     */
    [[nodiscard]] auto retry_count() const -> std::size_t;

private:
    session_factory& factory_;
    peripheral_ref peripheral_;
    connection_options options_;
    std::unique_ptr<ftp_session> session_;
    std::size_t retries_ = 0;
};

/**
 * @brief Hands out connections to peripherals
 */
class connection_manager {
public:
    connection_manager(std::shared_ptr<session_factory> factory, connection_options options);

    /**
     * @brief Open a connection owned by the caller
     */
    [[nodiscard]] auto open(const peripheral_ref& peripheral)
        -> result<std::unique_ptr<peripheral_connection>>;

    /**
     * @brief Connect, run @p fn, and close on every exit path
     *
     * @p fn receives the peripheral_connection and returns a result<T>; a
     * connect or login failure is returned without calling it.
     */
    template <typename Fn>
    auto with_connection(const peripheral_ref& peripheral, Fn&& fn)
        -> std::invoke_result_t<Fn, peripheral_connection&> {
        auto conn = open(peripheral);
        if (!conn) {
            return unexpected{conn.error()};
        }
        return std::forward<Fn>(fn)(*conn.value());
    }

    [[nodiscard]] auto options() const -> const connection_options&;

private:
    std::shared_ptr<session_factory> factory_;
    connection_options options_;
};

/**
 * @brief Scoped change of the remote working directory
 *
 * The directory current at enter() is restored when the guard goes out of
 * scope, whatever the outcome of the work done inside.
 */
class scoped_remote_directory {
public:
    explicit scoped_remote_directory(ftp_session& session);
    ~scoped_remote_directory();

    scoped_remote_directory(const scoped_remote_directory&) = delete;
    auto operator=(const scoped_remote_directory&) -> scoped_remote_directory& = delete;

    [[nodiscard]] auto enter(const std::string& path) -> result<void>;

private:
    ftp_session& session_;
    std::string previous_;
    bool entered_ = false;
};

/**
 * @brief Run @p fn with the remote working directory set to @p path
 */
template <typename Fn>
auto with_remote_directory(ftp_session& session, const std::string& path, Fn&& fn)
    -> std::invoke_result_t<Fn> {
    scoped_remote_directory guard(session);
    if (auto entered = guard.enter(path); !entered) {
        return unexpected{entered.error()};
    }
    return std::forward<Fn>(fn)();
}

/**
 * @brief Run a path command, falling back to "cwd parent, use basename"
 *
 * Some servers reject full paths in STOR/RETR/DELE/RMD. When @p op fails
 * with a permanent remote error, it is retried once with the basename of
 * @p path inside the parent directory. If the parent cannot be entered the
 * original error is returned.
 */
[[nodiscard]] auto with_parent_directory_fallback(
    ftp_session& session,
    const std::string& path,
    const std::function<result<void>(const std::string& target)>& op) -> result<void>;

/**
 * @brief Create a remote directory and its missing parents with MKD
 *
 * Each component is created in turn; a refused MKD (typically "already
 * exists") is not an error. Only a lost connection aborts.
 */
[[nodiscard]] auto ensure_remote_directory(ftp_session& session, const std::string& path)
    -> result<void>;

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_FTP_CONNECTION_MANAGER_H
