/**
 * @file action_codes.h
 * @brief Action codes carried in command and response envelopes
 */

#ifndef FTP_BRIDGE_PROTOCOL_ACTION_CODES_H
#define FTP_BRIDGE_PROTOCOL_ACTION_CODES_H

#include <cstdint>

namespace ftp_bridge {

/**
 * @brief Wire action codes
 *
 * Code 63 is DELETE_REMOTE_FILE in the standard profile and DOWNLOAD_FILE
 * in the legacy profile; see action_table for how a deployment picks one.
 */
enum class action_code : int32_t {
    start_stream_file = 33,
    finish_stream_file = 34,
    stream_file = 35,
    start_download_file = 55,
    finish_download_file = 56,
    error_download_file = 57,
    get_server_file_tree = 58,
    get_remote_file_tree = 59,
    server_file_tree = 60,
    client_file_tree = 61,
    error = 62,
    delete_remote_file = 63,
    delete_remote_directory = 64,
    stream_directory = 65,
    download_directory = 66,
    progress_send_file = 67,
    list_peripherals = 68,
};

/// Legacy name for code 63
inline constexpr int32_t legacy_download_file_code = 63;

[[nodiscard]] constexpr auto to_int(action_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

[[nodiscard]] constexpr auto to_string(action_code code) noexcept -> const char* {
    switch (code) {
        case action_code::start_stream_file: return "START_STREAM_FILE";
        case action_code::finish_stream_file: return "FINISH_STREAM_FILE";
        case action_code::stream_file: return "STREAM_FILE";
        case action_code::start_download_file: return "START_DOWNLOAD_FILE";
        case action_code::finish_download_file: return "FINISH_DOWNLOAD_FILE";
        case action_code::error_download_file: return "ERROR_DOWNLOAD_FILE";
        case action_code::get_server_file_tree: return "GET_SERVER_FILE_TREE";
        case action_code::get_remote_file_tree: return "GET_REMOTE_FILE_TREE";
        case action_code::server_file_tree: return "SERVER_FILE_TREE";
        case action_code::client_file_tree: return "CLIENT_FILE_TREE";
        case action_code::error: return "ERROR";
        case action_code::delete_remote_file: return "DELETE_REMOTE_FILE";
        case action_code::delete_remote_directory: return "DELETE_REMOTE_DIRECTORY";
        case action_code::stream_directory: return "STREAM_DIRECTORY";
        case action_code::download_directory: return "DOWNLOAD_DIRECTORY";
        case action_code::progress_send_file: return "PROGRESS_SEND_FILE";
        case action_code::list_peripherals: return "LIST_PERIPHERALS";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Notification codes used by one streamed transfer direction
 */
struct stream_codes {
    action_code start;
    action_code progress;
    action_code finish;
    action_code failure;
};

/// Uploads (single file and directory)
inline constexpr stream_codes upload_stream_codes{
    action_code::start_stream_file,
    action_code::progress_send_file,
    action_code::finish_stream_file,
    action_code::error,
};

/// Downloads (single file and directory)
inline constexpr stream_codes download_stream_codes{
    action_code::start_download_file,
    action_code::progress_send_file,
    action_code::finish_download_file,
    action_code::error_download_file,
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_PROTOCOL_ACTION_CODES_H
