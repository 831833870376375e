/**
 * @file bridge_config.cpp
 * @brief Bridge configuration loader
 */

#include <ftp_bridge/config/bridge_config.h>

#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include <ftp_bridge/core/json_codec.h>

namespace ftp_bridge {

namespace {

auto invalid(const std::string& key, const std::string& reason) -> unexpected {
    return unexpected{error{error_code::invalid_configuration, key + ": " + reason}};
}

auto read_integer(const Json::Value& obj, const char* key, const std::string& path, int64_t min_value,
                  int64_t max_value, int64_t& out) -> result<void> {
    const auto* member = find_member(obj, key);
    if (member == nullptr || member->isNull()) {
        return {};
    }
    const auto parsed = as_int64(*member);
    if (!parsed) {
        return invalid(path, "must be an integer");
    }
    const auto value = *parsed;
    if (value < min_value || value > max_value) {
        return invalid(path, "must be between " + std::to_string(min_value) + " and " +
                                 std::to_string(max_value));
    }
    out = value;
    return {};
}

auto read_bool(const Json::Value& obj, const char* key, const std::string& path, bool& out)
    -> result<void> {
    const auto* member = find_member(obj, key);
    if (member == nullptr || member->isNull()) {
        return {};
    }
    if (!member->isBool()) {
        return invalid(path, "must be a boolean");
    }
    out = member->asBool();
    return {};
}

auto read_string(const Json::Value& obj, const char* key, const std::string& path, std::string& out)
    -> result<void> {
    const auto* member = find_member(obj, key);
    if (member == nullptr || member->isNull()) {
        return {};
    }
    if (!member->isString()) {
        return invalid(path, "must be a string");
    }
    out = member->asString();
    return {};
}

auto read_millis(const Json::Value& obj, const char* key, const std::string& path,
                 std::chrono::milliseconds& out) -> result<void> {
    int64_t value = out.count();
    if (auto r = read_integer(obj, key, path, 1, std::numeric_limits<int32_t>::max(), value); !r) {
        return r;
    }
    out = std::chrono::milliseconds{value};
    return {};
}

auto parse_connection(const Json::Value& obj, connection_options& out) -> result<void> {
    if (!obj.isObject()) {
        return invalid("connection", "must be an object");
    }
    if (auto r = read_millis(obj, "connect_timeout_ms", "connection.connect_timeout_ms",
                             out.connect_timeout);
        !r) {
        return r;
    }
    if (auto r = read_millis(obj, "io_timeout_ms", "connection.io_timeout_ms", out.io_timeout);
        !r) {
        return r;
    }
    int64_t retry = out.retry_delay.count();
    if (auto r = read_integer(obj, "retry_delay_ms", "connection.retry_delay_ms", 0,
                              std::numeric_limits<int32_t>::max(), retry);
        !r) {
        return r;
    }
    out.retry_delay = std::chrono::milliseconds{retry};
    if (auto r = read_bool(obj, "passive", "connection.passive", out.passive); !r) {
        return r;
    }
    return read_bool(obj, "verify_tls", "connection.verify_tls", out.verify_tls);
}

auto parse_logging(const Json::Value& obj, logging_config& out) -> result<void> {
    if (!obj.isObject()) {
        return invalid("logging", "must be an object");
    }
    std::string level;
    if (auto r = read_string(obj, "level", "logging.level", level); !r) {
        return r;
    }
    if (!level.empty()) {
        auto parsed = log_level_from_string(level);
        if (!parsed) {
            return invalid("logging.level", "unknown level '" + level + "'");
        }
        out.level = *parsed;
    }
    if (auto r = read_bool(obj, "json", "logging.json", out.json); !r) {
        return r;
    }
    return read_bool(obj, "mask_sensitive", "logging.mask_sensitive", out.mask_sensitive);
}

auto parse_peripheral(const Json::Value& obj, std::size_t position) -> result<peripheral_ref> {
    const auto prefix = "peripherals[" + std::to_string(position) + "]";
    if (!obj.isObject()) {
        return invalid(prefix, "must be an object");
    }

    peripheral_ref p;
    if (!obj.isMember("index")) {
        return invalid(prefix + ".index", "is required");
    }
    int64_t index = 0;
    if (auto r = read_integer(obj, "index", prefix + ".index", 0,
                              std::numeric_limits<int32_t>::max(), index);
        !r) {
        return unexpected{r.error()};
    }
    p.index = static_cast<int32_t>(index);

    if (auto r = read_string(obj, "host", prefix + ".host", p.server.host); !r) {
        return unexpected{r.error()};
    }
    if (p.server.host.empty()) {
        return invalid(prefix + ".host", "is required");
    }
    int64_t port = p.server.port;
    if (auto r = read_integer(obj, "port", prefix + ".port", 1, 65535, port); !r) {
        return unexpected{r.error()};
    }
    p.server.port = static_cast<uint16_t>(port);

    for (auto [key, target] : {std::pair{"name", &p.name},
                               std::pair{"user", &p.user},
                               std::pair{"password", &p.password},
                               std::pair{"local_root", &p.local_root},
                               std::pair{"remote_root", &p.remote_root},
                               std::pair{"inbound_queue", &p.inbound_queue},
                               std::pair{"outbound_queue", &p.outbound_queue}}) {
        if (auto r = read_string(obj, key, prefix + "." + key, *target); !r) {
            return unexpected{r.error()};
        }
    }
    if (auto r = read_bool(obj, "use_tls", prefix + ".use_tls", p.use_tls); !r) {
        return unexpected{r.error()};
    }
    if (p.name.empty()) {
        p.name = "peripheral-" + std::to_string(p.index);
    }
    return p;
}

}  // namespace

auto validate(const bridge_config& config) -> result<void> {
    if (config.engine.chunk_size < min_chunk_size || config.engine.chunk_size > max_chunk_size) {
        return invalid("chunk_size", "must be between " + std::to_string(min_chunk_size) +
                                         " and " + std::to_string(max_chunk_size));
    }
    if (config.connection.connect_timeout.count() <= 0) {
        return invalid("connection.connect_timeout_ms", "must be positive");
    }
    if (config.connection.io_timeout.count() <= 0) {
        return invalid("connection.io_timeout_ms", "must be positive");
    }
    if (config.poll_interval.count() <= 0) {
        return invalid("poll_interval_ms", "must be positive");
    }

    std::set<int32_t> seen;
    for (const auto& p : config.peripherals) {
        if (p.index < 0) {
            return invalid("peripherals.index", "must not be negative");
        }
        if (!seen.insert(p.index).second) {
            return invalid("peripherals.index", "duplicate index " + std::to_string(p.index));
        }
        if (p.server.host.empty()) {
            return invalid("peripherals[" + std::to_string(p.index) + "].host", "is required");
        }
    }

    if (auto table = action_table::build(config.profile, config.action_overrides); !table) {
        return unexpected{table.error()};
    }
    return {};
}

auto parse_bridge_config(std::string_view text) -> result<bridge_config> {
    auto parsed_doc = parse_json(text);
    if (!parsed_doc || !parsed_doc->isObject()) {
        return invalid("<root>", "configuration must be a JSON object");
    }
    const Json::Value& doc = *parsed_doc;

    bridge_config config;

    int64_t chunk = static_cast<int64_t>(config.engine.chunk_size);
    if (auto r = read_integer(doc, "chunk_size", "chunk_size", static_cast<int64_t>(min_chunk_size),
                              static_cast<int64_t>(max_chunk_size), chunk);
        !r) {
        return unexpected{r.error()};
    }
    config.engine.chunk_size = static_cast<std::size_t>(chunk);

    if (const auto* it = find_member(doc, "connection")) {
        if (auto r = parse_connection(*it, config.connection); !r) {
            return unexpected{r.error()};
        }
    }

    std::string profile;
    if (auto r = read_string(doc, "action_profile", "action_profile", profile); !r) {
        return unexpected{r.error()};
    }
    if (!profile.empty()) {
        auto parsed = action_profile_from_string(profile);
        if (!parsed) {
            return invalid("action_profile", "must be \"standard\" or \"legacy\"");
        }
        config.profile = *parsed;
    }

    if (const auto* it = find_member(doc, "action_overrides"); it != nullptr && !it->isNull()) {
        if (!it->isObject()) {
            return invalid("action_overrides", "must be an object");
        }
        for (const auto& name : it->getMemberNames()) {
            const auto code = as_int64((*it)[name]);
            if (!code) {
                return invalid("action_overrides." + name, "must be an integer");
            }
            const auto value = *code;
            if (value <= 0 || value > std::numeric_limits<int32_t>::max()) {
                return invalid("action_overrides." + name, "must be a positive 32-bit code");
            }
            config.action_overrides[name] = static_cast<int32_t>(value);
        }
    }

    std::string history;
    if (auto r = read_string(doc, "history_file", "history_file", history); !r) {
        return unexpected{r.error()};
    }
    config.history_file = history;

    if (const auto* it = find_member(doc, "logging")) {
        if (auto r = parse_logging(*it, config.logging); !r) {
            return unexpected{r.error()};
        }
    }

    if (auto r = read_millis(doc, "poll_interval_ms", "poll_interval_ms", config.poll_interval);
        !r) {
        return unexpected{r.error()};
    }

    if (const auto* it = find_member(doc, "peripherals"); it != nullptr && !it->isNull()) {
        if (!it->isArray()) {
            return invalid("peripherals", "must be an array");
        }
        for (Json::ArrayIndex i = 0; i < it->size(); ++i) {
            auto p = parse_peripheral((*it)[i], i);
            if (!p) {
                return unexpected{p.error()};
            }
            config.peripherals.push_back(std::move(p.value()));
        }
    }

    if (auto valid = validate(config); !valid) {
        return unexpected{valid.error()};
    }
    return config;
}

auto load_bridge_config(const std::filesystem::path& file) -> result<bridge_config> {
    std::ifstream in(file);
    if (!in) {
        return unexpected{error{error_code::invalid_configuration,
                                "Cannot read configuration file " + file.string()}};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_bridge_config(buffer.str());
}

void apply_logging_config(const logging_config& config) {
    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(config.level);
    logger.enable_json_output(config.json);
    logger.enable_masking(config.mask_sensitive);
}

}  // namespace ftp_bridge
