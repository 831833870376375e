/**
 * @file envelope.cpp
 * @brief Command and response envelope codec
 */

#include <ftp_bridge/protocol/envelope.h>

#include <limits>

#include <ftp_bridge/core/json_codec.h>

namespace ftp_bridge {

namespace {

auto malformed(const std::string& why) -> unexpected {
    return unexpected{error{error_code::malformed_envelope, "Malformed envelope: " + why}};
}

auto read_int32(const Json::Value& node, const char* name) -> result<int32_t> {
    auto v = as_int64(node);
    if (!v) {
        if (node.type() == Json::uintValue) {
            return malformed(std::string(name) + " out of range");
        }
        return malformed(std::string(name) + " must be an integer");
    }
    if (*v < std::numeric_limits<int32_t>::min() || *v > std::numeric_limits<int32_t>::max()) {
        return malformed(std::string(name) + " out of range");
    }
    return static_cast<int32_t>(*v);
}

auto invalid_payload(const std::string& why) -> unexpected {
    return unexpected{error{error_code::invalid_payload, "Invalid payload: " + why}};
}

}  // namespace

auto command_envelope::send_to() const -> std::optional<std::string> {
    if (!extra) {
        return std::nullopt;
    }
    const auto* target = find_member(*extra, "send_to");
    if (target == nullptr || !target->isString() || target->asString().empty()) {
        return std::nullopt;
    }
    return target->asString();
}

auto decode_command(std::string_view raw) -> result<command_envelope> {
    auto doc = parse_json(raw);
    if (!doc) {
        return malformed("not valid JSON");
    }
    if (!doc->isObject()) {
        return malformed("top level must be an object");
    }

    const auto* action_node = find_member(*doc, "action");
    if (action_node == nullptr) {
        return malformed("missing action");
    }
    auto action = read_int32(*action_node, "action");
    if (!action) {
        return unexpected{action.error()};
    }

    const auto* data = find_member(*doc, "data");
    if (data == nullptr || !data->isObject()) {
        return malformed("missing data object");
    }
    const auto* index_node = find_member(*data, "index");
    if (index_node == nullptr) {
        return malformed("missing data.index");
    }
    auto index = read_int32(*index_node, "data.index");
    if (!index) {
        return unexpected{index.error()};
    }

    command_envelope cmd;
    cmd.action = action.value();
    cmd.index = index.value();

    if (const auto* value = find_member(*data, "value")) {
        cmd.value = *value;
    }
    if (const auto* extra = find_member(*data, "extra"); extra != nullptr && !extra->isNull()) {
        cmd.extra = *extra;
    }
    return cmd;
}

auto encode_command(const command_envelope& command) -> std::string {
    Json::Value data(Json::objectValue);
    data["index"] = command.index;
    data["value"] = command.value;
    if (command.extra) {
        data["extra"] = *command.extra;
    }

    Json::Value doc(Json::objectValue);
    doc["action"] = command.action;
    doc["data"] = std::move(data);
    return write_json(doc);
}

auto to_json(const response_envelope& response) -> Json::Value {
    Json::Value data(Json::objectValue);
    data["index"] = response.index;
    data["value"] = response.value;
    data["timestamp"] = static_cast<Json::Int64>(response.timestamp);
    if (response.extra) {
        data["extra"] = *response.extra;
    }

    Json::Value doc(Json::objectValue);
    doc["action"] = response.action;
    doc["data"] = std::move(data);
    return doc;
}

auto encode_response(const response_envelope& response) -> std::string {
    return write_json(to_json(response));
}

auto decode_response(std::string_view raw) -> result<response_envelope> {
    auto doc = parse_json(raw);
    if (!doc || !doc->isObject()) {
        return malformed("response is not a JSON object");
    }

    const auto* action_node = find_member(*doc, "action");
    const auto* data = find_member(*doc, "data");
    if (action_node == nullptr || data == nullptr || !data->isObject()) {
        return malformed("response missing action or data");
    }

    auto action = read_int32(*action_node, "action");
    if (!action) {
        return unexpected{action.error()};
    }
    const auto* index_node = find_member(*data, "index");
    if (index_node == nullptr) {
        return malformed("response missing data.index");
    }
    auto index = read_int32(*index_node, "data.index");
    if (!index) {
        return unexpected{index.error()};
    }

    response_envelope resp;
    resp.action = action.value();
    resp.index = index.value();
    resp.value = data->get("value", "");

    const auto* ts = find_member(*data, "timestamp");
    auto timestamp = ts ? as_int64(*ts) : std::nullopt;
    if (!timestamp) {
        return malformed("response timestamp must be an integer");
    }
    resp.timestamp = *timestamp;

    if (const auto* extra = find_member(*data, "extra")) {
        resp.extra = *extra;
    }
    return resp;
}

auto payload_string(const Json::Value& value, std::string_view key) -> result<std::string> {
    auto field = payload_optional_string(value, key);
    if (!field) {
        return unexpected{field.error()};
    }
    if (!field.value()) {
        return invalid_payload("missing '" + std::string(key) + "'");
    }
    return std::move(*field.value());
}

auto payload_optional_string(const Json::Value& value, std::string_view key)
    -> result<std::optional<std::string>> {
    if (!value.isObject()) {
        return invalid_payload("value must be an object");
    }
    const auto* member = find_member(value, std::string(key));
    if (member == nullptr || member->isNull()) {
        return std::optional<std::string>{};
    }
    if (!member->isString()) {
        return invalid_payload("'" + std::string(key) + "' must be a string");
    }
    return std::optional<std::string>{member->asString()};
}

auto payload_path(const Json::Value& value, std::string_view key) -> result<std::string> {
    if (value.isNull()) {
        return std::string{};
    }
    if (value.isString()) {
        return value.asString();
    }
    auto field = payload_optional_string(value, key);
    if (!field) {
        return unexpected{field.error()};
    }
    return field.value().value_or(std::string{});
}

}  // namespace ftp_bridge
