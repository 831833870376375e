/**
 * @file json_codec.cpp
 * @brief jsoncpp reader/writer setup
 */

#include <ftp_bridge/core/json_codec.h>

#include <limits>
#include <memory>

namespace ftp_bridge {

auto parse_json(std::string_view text, std::string* error_out) -> std::optional<Json::Value> {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    bool parsed = false;
    try {
        parsed = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception& e) {
        // Nesting past the reader's stack limit throws instead of failing
        errors = e.what();
    }
    if (!parsed) {
        if (error_out) {
            *error_out = errors;
        }
        return std::nullopt;
    }
    return root;
}

auto write_json(const Json::Value& value) -> std::string {
    static const Json::StreamWriterBuilder builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"] = true;
        return b;
    }();
    return Json::writeString(builder, value);
}

auto as_int64(const Json::Value& value) -> std::optional<int64_t> {
    if (value.type() == Json::intValue) {
        return value.asInt64();
    }
    if (value.type() == Json::uintValue &&
        value.asLargestUInt() <= static_cast<Json::LargestUInt>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(value.asLargestUInt());
    }
    return std::nullopt;
}

}  // namespace ftp_bridge
