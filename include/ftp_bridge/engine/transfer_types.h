/**
 * @file transfer_types.h
 * @brief Transfer state, progress records and summaries
 */

#ifndef FTP_BRIDGE_ENGINE_TRANSFER_TYPES_H
#define FTP_BRIDGE_ENGINE_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace ftp_bridge {

/**
 * @brief Per-operation state
 *
 * INIT -> CONNECTING -> {LISTING | TRANSFERRING} -> COMPLETE | FAILED.
 * Directory downloads list before transferring.
 */
enum class transfer_state {
    init,
    connecting,
    listing,
    transferring,
    complete,
    failed,
};

[[nodiscard]] constexpr auto to_string(transfer_state state) noexcept -> std::string_view {
    switch (state) {
        case transfer_state::init:
            return "init";
        case transfer_state::connecting:
            return "connecting";
        case transfer_state::listing:
            return "listing";
        case transfer_state::transferring:
            return "transferring";
        case transfer_state::complete:
            return "complete";
        case transfer_state::failed:
            return "failed";
        default:
            return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(transfer_state state) noexcept -> bool {
    return state == transfer_state::complete || state == transfer_state::failed;
}

/**
 * @brief Check if a state transition is valid
 */
[[nodiscard]] constexpr auto is_valid_transition(transfer_state from, transfer_state to) noexcept
    -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (to == transfer_state::failed) {
        return true;
    }

    switch (from) {
        case transfer_state::init:
            return to == transfer_state::connecting;
        case transfer_state::connecting:
            return to == transfer_state::listing || to == transfer_state::transferring;
        case transfer_state::listing:
            return to == transfer_state::transferring || to == transfer_state::complete;
        case transfer_state::transferring:
            return to == transfer_state::complete;
        default:
            return false;
    }
}

/**
 * @brief Progress of one file within a transfer
 *
 * file_index (1-based) and total_files are set for directory transfers only.
 */
struct progress_record {
    std::string file;
    std::optional<std::size_t> file_index;
    std::optional<std::size_t> total_files;
    uint64_t bytes_sent = 0;
    uint64_t total_bytes = 0;
    int percent = 0;
};

[[nodiscard]] auto to_json(const progress_record& record) -> Json::Value;

using progress_callback = std::function<void(const progress_record&)>;

/**
 * @brief Called once the peripheral session is established
 */
using started_callback = std::function<void()>;

/**
 * @brief Result of a successful upload or download
 */
struct transfer_summary {
    std::size_t files_transferred = 0;
    uint64_t bytes_transferred = 0;
    std::size_t retries = 0;
};

/**
 * @brief Result of a successful remote delete
 */
struct delete_summary {
    std::size_t files_deleted = 0;
    std::size_t directories_removed = 0;
};

/**
 * @brief Engine tuning
 */
struct engine_options {
    std::size_t chunk_size = 64 * 1024;
};

/**
 * @brief Turns byte counts into monotonic progress records
 *
 * percent = floor(bytes * 100 / total). A record is emitted only when the
 * byte count passes the previous high-water mark, so a retried transfer
 * that restarts from byte 0 stays silent until it catches up. percent 100
 * is emitted exactly once, by the byte count reaching the total or by
 * complete(). An unknown total reports percent 0 until complete().
 */
class progress_tracker {
public:
    progress_tracker(std::string file,
                     std::optional<uint64_t> total_bytes,
                     progress_callback callback,
                     std::optional<std::size_t> file_index = std::nullopt,
                     std::optional<std::size_t> total_files = std::nullopt);

    /**
     * @brief Start a new attempt from byte 0
     */
    void restart();

    void advance(uint64_t bytes);

    /**
     * @brief Mark the file done; emits the 100% record if not yet sent
     */
    void complete();

    [[nodiscard]] auto bytes() const -> uint64_t { return bytes_; }
    [[nodiscard]] auto reported_complete() const -> bool { return reported_complete_; }

private:
    void emit(uint64_t bytes, uint64_t total, int percent);

    std::string file_;
    std::optional<uint64_t> total_;
    progress_callback callback_;
    std::optional<std::size_t> file_index_;
    std::optional<std::size_t> total_files_;
    uint64_t bytes_ = 0;
    uint64_t high_water_ = 0;
    bool reported_complete_ = false;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_ENGINE_TRANSFER_TYPES_H
