/**
 * @file history_sink.h
 * @brief Append-only record of terminal command outcomes
 */

#ifndef FTP_BRIDGE_HISTORY_HISTORY_SINK_H
#define FTP_BRIDGE_HISTORY_HISTORY_SINK_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include <json/json.h>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief One terminal outcome
 *
 * operation_type is the handler name ("upload_file", ...), status is
 * "success" or "error", details is the terminal envelope.
 */
struct history_record {
    std::string operation_type;
    std::string status;
    Json::Value details;
    int64_t timestamp = 0;
};

[[nodiscard]] auto to_json(const history_record& record) -> Json::Value;

/**
 * @brief History sink interface
 *
 * Written concurrently by every peripheral worker.
 */
class history_sink {
public:
    virtual ~history_sink() = default;

    [[nodiscard]] virtual auto record(const history_record& outcome) -> result<void> = 0;
};

/**
 * @brief Keeps records in memory
 */
class memory_history_sink : public history_sink {
public:
    [[nodiscard]] auto record(const history_record& outcome) -> result<void> override;

    [[nodiscard]] auto records() const -> std::vector<history_record>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    std::vector<history_record> records_;
    mutable std::mutex mutex_;
};

/**
 * @brief Appends one JSON object per line to a file
 */
class jsonl_history_sink : public history_sink {
public:
    explicit jsonl_history_sink(std::filesystem::path file);

    [[nodiscard]] auto record(const history_record& outcome) -> result<void> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return file_; }

private:
    std::filesystem::path file_;
    std::ofstream out_;
    std::mutex mutex_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_HISTORY_HISTORY_SINK_H
