/**
 * @file curl_ftp_session.cpp
 * @brief libcurl implementation of ftp_session
 *
 * Every request uses CURLFTPMETHOD_NOCWD, so libcurl never changes the
 * server directory on its own. Absolute paths travel in the URL as
 * "ftp://host:port//abs/path". Relative paths are sent with a leading
 * "CWD <tracked cwd>" quote command, which is what makes the cwd-plus-
 * basename fallback of the connection manager reach the server as
 * "CWD dir" followed by "STOR name".
 */

#include <ftp_bridge/ftp/curl_ftp_session.h>

#include <curl/curl.h>

#include <algorithm>
#include <optional>

#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/path_utils.h>

namespace ftp_bridge {

namespace {

auto curl_global_state() -> CURLcode {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    return rc;
}

/**
 * @brief Applies options in order and remembers the first failure
 */
class option_setter {
public:
    explicit option_setter(CURL* handle) : handle_(handle) {}

    template <typename T>
    auto operator()(CURLoption option, T value) -> option_setter& {
        if (rc_ == CURLE_OK) {
            rc_ = curl_easy_setopt(handle_, option, value);
            if (rc_ != CURLE_OK) {
                failed_option_ = static_cast<int>(option);
            }
        }
        return *this;
    }

    [[nodiscard]] auto status() const -> CURLcode { return rc_; }
    [[nodiscard]] auto failed_option() const -> int { return failed_option_; }

private:
    CURL* handle_;
    CURLcode rc_ = CURLE_OK;
    int failed_option_ = 0;
};

/**
 * @brief Owns a curl_slist for the duration of one request
 */
class quote_list {
public:
    quote_list() = default;
    ~quote_list() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }

    quote_list(const quote_list&) = delete;
    auto operator=(const quote_list&) -> quote_list& = delete;

    auto append(const std::string& command) -> bool {
        auto* next = curl_slist_append(list_, command.c_str());
        if (!next) {
            return false;
        }
        list_ = next;
        return true;
    }

    [[nodiscard]] auto get() const -> curl_slist* { return list_; }

private:
    curl_slist* list_ = nullptr;
};

struct upload_context {
    const data_source* source = nullptr;
    std::optional<error> failure;
};

struct download_context {
    const data_sink* sink = nullptr;
    std::optional<error> failure;
};

auto on_read(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* ctx = static_cast<upload_context*>(userdata);
    auto chunk = (*ctx->source)(std::span<std::byte>(reinterpret_cast<std::byte*>(buffer),
                                                     size * nitems));
    if (!chunk) {
        ctx->failure = chunk.error();
        return CURL_READFUNC_ABORT;
    }
    return chunk.value();
}

auto on_write(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* ctx = static_cast<download_context*>(userdata);
    const auto bytes = size * nmemb;
    auto written = (*ctx->sink)(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), bytes));
    if (!written) {
        ctx->failure = written.error();
        return 0;  // CURLE_WRITE_ERROR
    }
    return bytes;
}

auto on_listing(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

auto split_lines(const std::string& raw) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\n', start);
        if (end == std::string::npos) {
            end = raw.size();
        }
        auto line = raw.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }
    return lines;
}

auto to_seconds(std::chrono::milliseconds ms) -> long {
    return std::max<long>(1, static_cast<long>((ms.count() + 999) / 1000));
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct curl_ftp_session::impl {
    peripheral_ref peripheral;
    connection_options options;
    CURL* handle = nullptr;
    bool open = false;
    std::string current_dir = "/";
    char error_buffer[CURL_ERROR_SIZE] = {};

    impl(peripheral_ref p, connection_options o)
        : peripheral(std::move(p)), options(o) {}

    ~impl() { release(); }

    void release() {
        if (handle) {
            curl_easy_cleanup(handle);
            handle = nullptr;
        }
        open = false;
    }

    [[nodiscard]] auto base_url() const -> std::string {
        return "ftp://" + peripheral.server.host + ":" +
               std::to_string(peripheral.server.port) + "/";
    }

    [[nodiscard]] auto absolute(const std::string& path) const -> std::string {
        if (path.empty() || path == ".") {
            return current_dir;
        }
        if (path_utils::is_absolute(path)) {
            return path_utils::normalize(path);
        }
        return path_utils::normalize(path_utils::join(current_dir, path));
    }

    [[nodiscard]] auto escape(const std::string& path) const -> std::string {
        std::string out;
        std::size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            if (end == std::string::npos) {
                end = path.size();
            }
            auto component = path.substr(start, end - start);
            if (!component.empty()) {
                char* escaped =
                    curl_easy_escape(handle, component.c_str(), static_cast<int>(component.size()));
                if (escaped) {
                    if (!out.empty()) {
                        out += '/';
                    }
                    out += escaped;
                    curl_free(escaped);
                }
            }
            start = end + 1;
        }
        return out;
    }

    /**
     * @brief URL for a path; relative paths stay relative to the quote CWD
     */
    [[nodiscard]] auto url_for(const std::string& path, bool is_dir) const -> std::string {
        auto norm = path_utils::normalize(path);
        std::string url = base_url();
        if (path_utils::is_absolute(norm)) {
            url += "/" + escape(norm);
        } else {
            url += escape(norm);
        }
        if (is_dir && url.back() != '/') {
            url += '/';
        }
        return url;
    }

    [[nodiscard]] auto map_failure(CURLcode rc, const std::string& what,
                                   error_code on_missing) const -> error {
        long reply = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &reply);

        std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        std::string message = what + ": " + reason;
        if (reply > 0) {
            message += " (reply " + std::to_string(reply) + ")";
        }

        return error{detail::map_curl_failure(rc, reply, on_missing), message};
    }

    /**
     * @brief Reset per-request options and apply the session-wide ones
     */
    auto prepare(const std::string& url, option_setter& set) -> void {
        curl_easy_reset(handle);
        error_buffer[0] = '\0';

        set(CURLOPT_ERRORBUFFER, error_buffer)
           (CURLOPT_URL, url.c_str())
           (CURLOPT_USERNAME, peripheral.user.c_str())
           (CURLOPT_PASSWORD, peripheral.password.c_str())
           (CURLOPT_NOSIGNAL, 1L)
           (CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD))
           (CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()))
           (CURLOPT_LOW_SPEED_LIMIT, 1L)
           (CURLOPT_LOW_SPEED_TIME, to_seconds(options.io_timeout))
           (CURLOPT_SERVER_RESPONSE_TIMEOUT, to_seconds(options.io_timeout))
           (CURLOPT_TCP_KEEPALIVE, 1L);

        if (!options.passive) {
            set(CURLOPT_FTPPORT, "-");
        }

        if (peripheral.use_tls) {
            const long verify = options.verify_tls ? 1L : 0L;
            set(CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL))
               (CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS))
               (CURLOPT_SSL_VERIFYPEER, verify)
               (CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
        }
    }

    /**
     * @brief Quote list that moves to the tracked cwd for relative paths
     */
    [[nodiscard]] auto enter_cwd_for(const std::string& path, quote_list& quote) const -> bool {
        if (path_utils::is_absolute(path)) {
            return true;
        }
        return quote.append("CWD " + current_dir);
    }

    auto perform(const std::string& what, option_setter& set, error_code on_missing)
        -> result<void> {
        if (set.status() != CURLE_OK) {
            return unexpected{error{error_code::internal_error,
                                    what + ": curl_easy_setopt(" +
                                        std::to_string(set.failed_option()) + ") failed: " +
                                        curl_easy_strerror(set.status())}};
        }
        const CURLcode rc = curl_easy_perform(handle);
        if (rc != CURLE_OK) {
            return unexpected{map_failure(rc, what, on_missing)};
        }
        return {};
    }

    auto require_open(const std::string& what) const -> result<void> {
        if (!open || !handle) {
            return unexpected{error{error_code::connection_lost, what + ": session is not open"}};
        }
        return {};
    }

    auto command(const std::string& verb, const std::string& path, error_code on_missing)
        -> result<void> {
        auto what = verb + " " + path;
        if (auto ok = require_open(what); !ok) {
            return ok;
        }

        quote_list quote;
        if (!enter_cwd_for(path, quote) || !quote.append(verb + " " + path)) {
            return unexpected{error{error_code::internal_error, what + ": out of memory"}};
        }

        option_setter set(handle);
        prepare(base_url(), set);
        set(CURLOPT_NOBODY, 1L)(CURLOPT_QUOTE, quote.get());
        return perform(what, set, on_missing);
    }

    auto listing(const std::string& path, const char* custom_request)
        -> result<std::vector<std::string>> {
        auto target = absolute(path);
        auto what = std::string(custom_request ? custom_request : "LIST") + " " + target;
        if (auto ok = require_open(what); !ok) {
            return unexpected{ok.error()};
        }

        std::string raw;
        option_setter set(handle);
        prepare(url_for(target, true), set);
        set(CURLOPT_WRITEFUNCTION, on_listing)(CURLOPT_WRITEDATA, &raw);
        if (custom_request) {
            set(CURLOPT_CUSTOMREQUEST, custom_request);
        }

        auto done = perform(what, set, error_code::remote_file_not_found);
        if (!done) {
            return unexpected{done.error()};
        }
        return split_lines(raw);
    }
};

// ============================================================================
// curl_ftp_session
// ============================================================================

curl_ftp_session::curl_ftp_session(peripheral_ref peripheral, connection_options options)
    : impl_(std::make_unique<impl>(std::move(peripheral), options)) {}

curl_ftp_session::~curl_ftp_session() = default;

auto curl_ftp_session::connect() -> result<void> {
    if (curl_global_state() != CURLE_OK) {
        return unexpected{error{error_code::connection_error, "libcurl initialization failed"}};
    }

    impl_->release();
    impl_->handle = curl_easy_init();
    if (!impl_->handle) {
        return unexpected{error{error_code::connection_error, "curl_easy_init failed"}};
    }

    option_setter set(impl_->handle);
    impl_->prepare(impl_->base_url(), set);
    set(CURLOPT_NOBODY, 1L);

    auto what = std::string("connect to ") + impl_->peripheral.server.host + ":" +
                std::to_string(impl_->peripheral.server.port);
    auto done = impl_->perform(what, set, error_code::connection_error);
    if (!done) {
        auto err = done.error();
        // Anything short of a rejected login means the peripheral was not reachable
        if (err.code != error_code::login_failed) {
            err.code = error_code::connection_error;
        }
        impl_->release();
        return unexpected{err};
    }

    impl_->open = true;
    const char* entry = nullptr;
    if (curl_easy_getinfo(impl_->handle, CURLINFO_FTP_ENTRY_PATH, &entry) == CURLE_OK && entry &&
        path_utils::is_absolute(entry)) {
        impl_->current_dir = path_utils::normalize(entry);
    } else {
        impl_->current_dir = "/";
    }
    return {};
}

void curl_ftp_session::close() {
    impl_->release();
}

auto curl_ftp_session::is_open() const -> bool {
    return impl_->open;
}

auto curl_ftp_session::pwd() -> result<std::string> {
    if (auto ok = impl_->require_open("PWD"); !ok) {
        return unexpected{ok.error()};
    }
    return impl_->current_dir;
}

auto curl_ftp_session::cwd(const std::string& path) -> result<void> {
    auto target = impl_->absolute(path);
    auto changed = impl_->command("CWD", target, error_code::remote_file_not_found);
    if (!changed) {
        return changed;
    }
    impl_->current_dir = target;
    return {};
}

auto curl_ftp_session::mlsd(const std::string& path) -> result<std::vector<std::string>> {
    return impl_->listing(path, "MLSD");
}

auto curl_ftp_session::list(const std::string& path) -> result<std::vector<std::string>> {
    return impl_->listing(path, nullptr);
}

auto curl_ftp_session::size(const std::string& path) -> result<uint64_t> {
    auto what = "SIZE " + path;
    if (auto ok = impl_->require_open(what); !ok) {
        return unexpected{ok.error()};
    }

    quote_list quote;
    if (!impl_->enter_cwd_for(path, quote)) {
        return unexpected{error{error_code::internal_error, what + ": out of memory"}};
    }

    option_setter set(impl_->handle);
    impl_->prepare(impl_->url_for(path, false), set);
    set(CURLOPT_NOBODY, 1L);
    if (quote.get()) {
        set(CURLOPT_QUOTE, quote.get());
    }

    auto done = impl_->perform(what, set, error_code::remote_file_not_found);
    if (!done) {
        return unexpected{done.error()};
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(impl_->handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) !=
            CURLE_OK ||
        length < 0) {
        return unexpected{error{error_code::remote_command_failed,
                                what + ": server did not report a size"}};
    }
    return static_cast<uint64_t>(length);
}

auto curl_ftp_session::make_directory(const std::string& path) -> result<void> {
    return impl_->command("MKD", path, error_code::remote_command_failed);
}

auto curl_ftp_session::delete_file(const std::string& path) -> result<void> {
    return impl_->command("DELE", path, error_code::remote_file_not_found);
}

auto curl_ftp_session::remove_directory(const std::string& path) -> result<void> {
    return impl_->command("RMD", path, error_code::remote_command_failed);
}

auto curl_ftp_session::store(const std::string& path, const data_source& source)
    -> result<void> {
    auto what = "STOR " + path;
    if (auto ok = impl_->require_open(what); !ok) {
        return ok;
    }

    quote_list quote;
    if (!impl_->enter_cwd_for(path, quote)) {
        return unexpected{error{error_code::internal_error, what + ": out of memory"}};
    }

    upload_context ctx;
    ctx.source = &source;

    option_setter set(impl_->handle);
    impl_->prepare(impl_->url_for(path, false), set);
    set(CURLOPT_UPLOAD, 1L)(CURLOPT_READFUNCTION, on_read)(CURLOPT_READDATA, &ctx);
    if (quote.get()) {
        set(CURLOPT_QUOTE, quote.get());
    }

    auto done = impl_->perform(what, set, error_code::remote_command_failed);
    if (ctx.failure) {
        return unexpected{*ctx.failure};
    }
    return done;
}

auto curl_ftp_session::retrieve(const std::string& path, const data_sink& sink)
    -> result<void> {
    auto what = "RETR " + path;
    if (auto ok = impl_->require_open(what); !ok) {
        return ok;
    }

    quote_list quote;
    if (!impl_->enter_cwd_for(path, quote)) {
        return unexpected{error{error_code::internal_error, what + ": out of memory"}};
    }

    download_context ctx;
    ctx.sink = &sink;

    option_setter set(impl_->handle);
    impl_->prepare(impl_->url_for(path, false), set);
    set(CURLOPT_WRITEFUNCTION, on_write)(CURLOPT_WRITEDATA, &ctx);
    if (quote.get()) {
        set(CURLOPT_QUOTE, quote.get());
    }

    auto done = impl_->perform(what, set, error_code::remote_file_not_found);
    if (ctx.failure) {
        return unexpected{*ctx.failure};
    }
    return done;
}

// ============================================================================
// curl_session_factory
// ============================================================================

curl_session_factory::curl_session_factory(connection_options options)
    : options_(options) {}

auto curl_session_factory::create(const peripheral_ref& peripheral)
    -> std::unique_ptr<ftp_session> {
    FB_LOG_DEBUG(log_category::connection,
                 "Creating FTP session for peripheral " + std::to_string(peripheral.index));
    return std::make_unique<curl_ftp_session>(peripheral, options_);
}

namespace detail {

auto map_curl_failure(int curl_code, long reply_code, error_code on_missing) -> error_code {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_USE_SSL_FAILED:
        case CURLE_FTP_WEIRD_SERVER_REPLY:
            return error_code::connection_error;
        case CURLE_LOGIN_DENIED:
            return error_code::login_failed;
        case CURLE_OPERATION_TIMEDOUT:
            return error_code::connection_timeout;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_ACCEPT_FAILED:
            return error_code::connection_lost;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return on_missing;
        default:
            break;
    }

    if (reply_code == 500 || reply_code == 502 || reply_code == 504) {
        return error_code::command_not_supported;
    }
    if (reply_code == 550 || reply_code == 450) {
        return on_missing;
    }
    return error_code::remote_command_failed;
}

}  // namespace detail

}  // namespace ftp_bridge
