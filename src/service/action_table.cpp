/**
 * @file action_table.cpp
 * @brief Action table construction
 */

#include <ftp_bridge/service/action_table.h>

#include <array>
#include <utility>
#include <vector>

#include <ftp_bridge/protocol/action_codes.h>

namespace ftp_bridge {

namespace {

constexpr std::array all_handlers{
    handler_id::list_local,       handler_id::list_remote,        handler_id::upload_file,
    handler_id::download_file,    handler_id::upload_directory,   handler_id::download_directory,
    handler_id::delete_file,      handler_id::delete_directory,   handler_id::list_peripherals,
};

auto profile_bindings(action_profile profile) -> std::vector<std::pair<handler_id, action_code>> {
    std::vector<std::pair<handler_id, action_code>> out{
        {handler_id::list_local, action_code::get_server_file_tree},
        {handler_id::list_remote, action_code::get_remote_file_tree},
        {handler_id::upload_file, action_code::stream_file},
        {handler_id::upload_directory, action_code::stream_directory},
        {handler_id::download_directory, action_code::download_directory},
        {handler_id::delete_directory, action_code::delete_remote_directory},
        {handler_id::list_peripherals, action_code::list_peripherals},
    };
    if (profile == action_profile::legacy) {
        out.emplace_back(handler_id::download_file, action_code::delete_remote_file);
    } else {
        out.emplace_back(handler_id::delete_file, action_code::delete_remote_file);
    }
    return out;
}

}  // namespace

auto handler_from_string(std::string_view name) -> std::optional<handler_id> {
    for (auto id : all_handlers) {
        if (to_string(id) == name) {
            return id;
        }
    }
    return std::nullopt;
}

auto action_profile_from_string(std::string_view name) -> std::optional<action_profile> {
    if (name == "standard") {
        return action_profile::standard;
    }
    if (name == "legacy") {
        return action_profile::legacy;
    }
    return std::nullopt;
}

auto action_table::build(action_profile profile, const std::map<std::string, int32_t>& overrides)
    -> result<action_table> {
    std::map<handler_id, int32_t> by_handler;
    for (const auto& [id, code] : profile_bindings(profile)) {
        by_handler[id] = to_int(code);
    }

    for (const auto& [name, code] : overrides) {
        auto id = handler_from_string(name);
        if (!id) {
            return unexpected{error{error_code::invalid_configuration,
                                    "action_overrides: unknown handler '" + name + "'"}};
        }
        if (code <= 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "action_overrides." + name + ": code must be positive"}};
        }
        by_handler[*id] = code;
    }

    action_table table;
    for (const auto& [id, code] : by_handler) {
        auto [it, inserted] = table.bindings_.emplace(code, id);
        if (!inserted) {
            return unexpected{error{error_code::action_code_collision,
                                    "Action code " + std::to_string(code) + " is bound to both " +
                                        std::string(to_string(it->second)) + " and " +
                                        std::string(to_string(id))}};
        }
    }
    return table;
}

auto action_table::resolve(int32_t code) const -> std::optional<handler_id> {
    auto it = bindings_.find(code);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto action_table::code_of(handler_id id) const -> std::optional<int32_t> {
    for (const auto& [code, bound] : bindings_) {
        if (bound == id) {
            return code;
        }
    }
    return std::nullopt;
}

}  // namespace ftp_bridge
