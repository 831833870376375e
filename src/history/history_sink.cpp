/**
 * @file history_sink.cpp
 * @brief History sink implementations
 */

#include <ftp_bridge/history/history_sink.h>

#include <ftp_bridge/core/json_codec.h>
#include <ftp_bridge/core/logging.h>

namespace ftp_bridge {

auto to_json(const history_record& record) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["operation_type"] = record.operation_type;
    out["status"] = record.status;
    out["details"] = record.details;
    out["timestamp"] = static_cast<Json::Int64>(record.timestamp);
    return out;
}

// ============================================================================
// memory_history_sink
// ============================================================================

auto memory_history_sink::record(const history_record& outcome) -> result<void> {
    std::lock_guard lock(mutex_);
    records_.push_back(outcome);
    return {};
}

auto memory_history_sink::records() const -> std::vector<history_record> {
    std::lock_guard lock(mutex_);
    return records_;
}

auto memory_history_sink::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return records_.size();
}

// ============================================================================
// jsonl_history_sink
// ============================================================================

jsonl_history_sink::jsonl_history_sink(std::filesystem::path file) : file_(std::move(file)) {}

auto jsonl_history_sink::record(const history_record& outcome) -> result<void> {
    const auto line = write_json(to_json(outcome));

    std::lock_guard lock(mutex_);
    if (!out_.is_open()) {
        if (file_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(file_.parent_path(), ec);
            if (ec) {
                return unexpected{error{error_code::history_write_error,
                                        "Cannot create " + file_.parent_path().string() + ": " +
                                            ec.message()}};
            }
        }
        out_.open(file_, std::ios::app);
        if (!out_) {
            return unexpected{error{error_code::history_write_error,
                                    "Cannot open history file " + file_.string()}};
        }
        FB_LOG_DEBUG(log_category::history, "Appending history to " + file_.string());
    }

    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        out_.close();
        out_.clear();
        return unexpected{error{error_code::history_write_error,
                                "Cannot write history file " + file_.string()}};
    }
    return {};
}

}  // namespace ftp_bridge
