/**
 * @file envelope.h
 * @brief Command and response envelope codec
 *
 * Wire shapes:
 * @code
 * command:  {"action": 35, "data": {"index": 2, "value": {...}, "extra": {...}}}
 * response: {"action": 33, "data": {"index": 2, "value": "", "timestamp": 1700000000}}
 * @endcode
 */

#ifndef FTP_BRIDGE_PROTOCOL_ENVELOPE_H
#define FTP_BRIDGE_PROTOCOL_ENVELOPE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief Decoded inbound command
 *
 * value is not validated here; handlers check its shape and report
 * invalid_payload. extra is carried verbatim into every response.
 */
struct command_envelope {
    int32_t action = 0;
    int32_t index = 0;
    Json::Value value = "";
    std::optional<Json::Value> extra;

    /**
     * @brief Redirect target named by extra.send_to, if any
     */
    [[nodiscard]] auto send_to() const -> std::optional<std::string>;
};

/**
 * @brief Outbound response or notification
 */
struct response_envelope {
    int32_t action = 0;
    int32_t index = 0;
    Json::Value value = "";
    int64_t timestamp = 0;
    std::optional<Json::Value> extra;
};

/**
 * @brief Decode raw bytes into a command envelope
 * @return command or malformed_envelope when the bytes are not a JSON
 *         object, or action / data.index is missing or not an integer
 */
[[nodiscard]] auto decode_command(std::string_view raw) -> result<command_envelope>;

/**
 * @brief Serialize a command (producer side; used by tools and tests)
 */
[[nodiscard]] auto encode_command(const command_envelope& command) -> std::string;

/**
 * @brief Serialize a response; numeric fields stay JSON integers
 */
[[nodiscard]] auto encode_response(const response_envelope& response) -> std::string;

/**
 * @brief Decode a response (consumer side; used by tools and tests)
 */
[[nodiscard]] auto decode_response(std::string_view raw) -> result<response_envelope>;

[[nodiscard]] auto to_json(const response_envelope& response) -> Json::Value;

// ============================================================================
// Payload accessors
// ============================================================================

/**
 * @brief Read a required string member of an object payload
 * @return the string, or invalid_payload naming the key
 */
[[nodiscard]] auto payload_string(const Json::Value& value, std::string_view key)
    -> result<std::string>;

/**
 * @brief Read an optional string member
 *
 * Missing or null yields an empty optional; any other non-string type is
 * invalid_payload.
 */
[[nodiscard]] auto payload_optional_string(const Json::Value& value, std::string_view key)
    -> result<std::optional<std::string>>;

/**
 * @brief Read a path from a payload that is either a bare string or an
 *        object holding @p key
 *
 * The empty string (the no-argument form) yields an empty path.
 */
[[nodiscard]] auto payload_path(const Json::Value& value, std::string_view key)
    -> result<std::string>;

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_PROTOCOL_ENVELOPE_H
