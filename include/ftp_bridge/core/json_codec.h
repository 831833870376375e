/**
 * @file json_codec.h
 * @brief Compact JSON text codec over jsoncpp
 */

#ifndef FTP_BRIDGE_CORE_JSON_CODEC_H
#define FTP_BRIDGE_CORE_JSON_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace ftp_bridge {

/**
 * @brief Parse JSON text
 * @return the document, or nullopt with the reader's message in @p error_out
 */
[[nodiscard]] auto parse_json(std::string_view text, std::string* error_out = nullptr)
    -> std::optional<Json::Value>;

/**
 * @brief Serialize without whitespace, one document per line
 */
[[nodiscard]] auto write_json(const Json::Value& value) -> std::string;

/**
 * @brief True for integer-typed values; 3.0 does not count
 */
[[nodiscard]] inline auto is_integer(const Json::Value& value) -> bool {
    return value.type() == Json::intValue || value.type() == Json::uintValue;
}

/**
 * @brief Integer value if it is integer-typed and fits int64
 */
[[nodiscard]] auto as_int64(const Json::Value& value) -> std::optional<int64_t>;

/**
 * @brief Member lookup that tolerates non-object values
 * @return pointer into @p object, or nullptr if absent
 */
[[nodiscard]] inline auto find_member(const Json::Value& object, const std::string& key)
    -> const Json::Value* {
    if (!object.isObject()) {
        return nullptr;
    }
    return object.find(key.data(), key.data() + key.size());
}

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_CORE_JSON_CODEC_H
