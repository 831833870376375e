/**
 * @file curl_ftp_session.h
 * @brief libcurl implementation of ftp_session
 */

#ifndef FTP_BRIDGE_FTP_CURL_FTP_SESSION_H
#define FTP_BRIDGE_FTP_CURL_FTP_SESSION_H

#include <memory>

#include <ftp_bridge/core/types.h>
#include <ftp_bridge/ftp/ftp_session.h>

namespace ftp_bridge {

namespace detail {

/**
 * @brief Classifies a failed libcurl request
 *
 * @param curl_code CURLcode returned by curl_easy_perform
 * @param reply_code last FTP reply code, 0 when none was received
 * @param on_missing code reported for a missing remote path
 *
 * Transport failures win over the reply code. Otherwise 500/502/504 mean
 * the command is not supported and 450/550 mean the path is missing.
 */
[[nodiscard]] auto map_curl_failure(int curl_code, long reply_code, error_code on_missing)
    -> error_code;

}  // namespace detail

/**
 * @brief FTP/FTPS session over one reused libcurl easy handle
 *
 * libcurl keeps the control connection alive between requests of the same
 * handle. The working directory is tracked on the client side: relative
 * paths are resolved against it and every request carries an absolute
 * path, so no request depends on server-side CWD state.
 *
 * With use_tls the session upgrades with AUTH TLS (explicit FTPS) and
 * protects the data channel.
 */
class curl_ftp_session : public ftp_session {
public:
    curl_ftp_session(peripheral_ref peripheral, connection_options options);
    ~curl_ftp_session() override;

    [[nodiscard]] auto connect() -> result<void> override;
    void close() override;
    [[nodiscard]] auto is_open() const -> bool override;

    [[nodiscard]] auto pwd() -> result<std::string> override;
    [[nodiscard]] auto cwd(const std::string& path) -> result<void> override;

    [[nodiscard]] auto mlsd(const std::string& path)
        -> result<std::vector<std::string>> override;
    [[nodiscard]] auto list(const std::string& path)
        -> result<std::vector<std::string>> override;

    [[nodiscard]] auto size(const std::string& path) -> result<uint64_t> override;
    [[nodiscard]] auto make_directory(const std::string& path) -> result<void> override;
    [[nodiscard]] auto delete_file(const std::string& path) -> result<void> override;
    [[nodiscard]] auto remove_directory(const std::string& path) -> result<void> override;

    [[nodiscard]] auto store(const std::string& path, const data_source& source)
        -> result<void> override;
    [[nodiscard]] auto retrieve(const std::string& path, const data_sink& sink)
        -> result<void> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory producing curl_ftp_session instances
 */
class curl_session_factory : public session_factory {
public:
    explicit curl_session_factory(connection_options options = {});

    [[nodiscard]] auto create(const peripheral_ref& peripheral)
        -> std::unique_ptr<ftp_session> override;

private:
    connection_options options_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_FTP_CURL_FTP_SESSION_H
