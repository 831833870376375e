// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <ftp_bridge/core/json_codec.h>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define FTP_BRIDGE_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace ftp_bridge {

/**
 * @brief Log categories for the bridge
 */
struct log_category {
    static constexpr std::string_view dispatcher = "ftp_bridge.dispatcher";
    static constexpr std::string_view connection = "ftp_bridge.connection";
    static constexpr std::string_view engine = "ftp_bridge.engine";
    static constexpr std::string_view listing = "ftp_bridge.listing";
    static constexpr std::string_view broker = "ftp_bridge.broker";
    static constexpr std::string_view service = "ftp_bridge.service";
    static constexpr std::string_view history = "ftp_bridge.history";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a log level name ("debug", "INFO", ...)
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_ips = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks peripheral addresses and file paths in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_ips) {
            return input;
        }

        std::string result = input;
        if (config_.mask_ips) {
            result = replace_all(result, ip_pattern(), [this](const std::string& m) {
                return mask_ip(m);
            });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(), [this](const std::string& m) {
                return mask_path(m);
            });
        }
        return result;
    }

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + "/" + path.substr(last_sep + 1);
    }

    /**
     * @brief Mask all but the last octet of an IPv4 address
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string {
        if (!config_.mask_ips || ip.empty()) {
            return ip;
        }

        auto last_dot = ip.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(ip.size(), config_.mask_char[0]);
        }
        return std::string(last_dot, config_.mask_char[0]) + ip.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    static auto ip_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");
        return pattern;
    }

    template <typename Replacer>
    static auto replace_all(const std::string& input, const std::regex& pattern,
                            Replacer&& replace) -> std::string {
        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, it->position() - last_pos);
            out += replace(it->str());
            last_pos = it->position() + it->length();
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for bridge operations
 */
struct bridge_log_context {
    std::optional<int> peripheral_index;
    std::optional<int> action;
    std::string file;
    std::optional<uint64_t> bytes_sent;
    std::optional<uint64_t> total_bytes;
    std::optional<int> percent;
    std::optional<std::size_t> file_index;
    std::optional<std::size_t> total_files;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> queue;
    std::optional<std::string> server_address;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        return write_json(to_value(masker));
    }

    /**
     * @brief Context fields as a JSON object; unset fields are omitted
     */
    [[nodiscard]] auto to_value(const sensitive_info_masker* masker) const -> Json::Value {
        Json::Value out(Json::objectValue);
        if (peripheral_index) out["index"] = *peripheral_index;
        if (action) out["action"] = *action;
        if (!file.empty()) out["file"] = masker ? masker->mask_path(file) : file;
        if (bytes_sent) out["bytes_sent"] = static_cast<Json::UInt64>(*bytes_sent);
        if (total_bytes) out["total_bytes"] = static_cast<Json::UInt64>(*total_bytes);
        if (percent) out["percent"] = *percent;
        if (file_index) out["file_index"] = static_cast<Json::UInt64>(*file_index);
        if (total_files) out["total_files"] = static_cast<Json::UInt64>(*total_files);
        if (duration_ms) out["duration_ms"] = static_cast<Json::UInt64>(*duration_ms);
        if (queue) out["queue"] = *queue;
        if (server_address) {
            out["server_address"] = masker ? masker->mask_ip(*server_address) : *server_address;
        }
        if (error_message) {
            out["error_message"] = masker ? masker->mask(*error_message) : *error_message;
        }
        return out;
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<bridge_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        Json::Value out(Json::objectValue);
        out["timestamp"] = timestamp;
        out["level"] = std::string(log_level_to_string(level));
        out["category"] = category;
        out["message"] = masker ? masker->mask(message) : message;

        if (context) {
            const auto fields = context->to_value(masker);
            for (const auto& name : fields.getMemberNames()) {
                out[name] = fields[name];
            }
        }

        if (source_file) {
            Json::Value source(Json::objectValue);
            source["file"] = *source_file;
            if (source_line) {
                source["line"] = *source_line;
            }
            out["source"] = std::move(source);
        }
        return write_json(out);
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Bridge logging facility
 *
 * Process-wide; shared by every peripheral worker thread.
 */
class bridge_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const bridge_log_context*)>;

    bridge_logger() = default;
    ~bridge_logger() = default;

    bridge_logger(const bridge_logger&) = delete;
    bridge_logger& operator=(const bridge_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Set custom log callback, invoked before the message is written
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const bridge_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            rendered = entry.to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            rendered = oss.str();
        }

#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        output_to_stderr(rendered);
    }

    void flush() {
#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef FTP_BRIDGE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline bridge_logger& get_logger() {
    static bridge_logger instance;
    return instance;
}

// Logging macros for convenience
#define FB_LOG(level, category, message) \
    ftp_bridge::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FB_LOG_CTX(level, category, message, context) \
    ftp_bridge::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FB_LOG_TRACE(category, message) \
    FB_LOG(ftp_bridge::log_level::trace, category, message)

#define FB_LOG_DEBUG(category, message) \
    FB_LOG(ftp_bridge::log_level::debug, category, message)

#define FB_LOG_INFO(category, message) \
    FB_LOG(ftp_bridge::log_level::info, category, message)

#define FB_LOG_WARN(category, message) \
    FB_LOG(ftp_bridge::log_level::warn, category, message)

#define FB_LOG_ERROR(category, message) \
    FB_LOG(ftp_bridge::log_level::error, category, message)

#define FB_LOG_DEBUG_CTX(category, message, ctx) \
    FB_LOG_CTX(ftp_bridge::log_level::debug, category, message, ctx)

#define FB_LOG_INFO_CTX(category, message, ctx) \
    FB_LOG_CTX(ftp_bridge::log_level::info, category, message, ctx)

#define FB_LOG_WARN_CTX(category, message, ctx) \
    FB_LOG_CTX(ftp_bridge::log_level::warn, category, message, ctx)

#define FB_LOG_ERROR_CTX(category, message, ctx) \
    FB_LOG_CTX(ftp_bridge::log_level::error, category, message, ctx)

}  // namespace ftp_bridge
