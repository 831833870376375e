/**
 * @file action_table.h
 * @brief Explicit mapping from action codes to handlers
 */

#ifndef FTP_BRIDGE_SERVICE_ACTION_TABLE_H
#define FTP_BRIDGE_SERVICE_ACTION_TABLE_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief Operations a peripheral worker can run
 */
enum class handler_id {
    list_local,
    list_remote,
    upload_file,
    download_file,
    upload_directory,
    download_directory,
    delete_file,
    delete_directory,
    list_peripherals,
};

[[nodiscard]] constexpr auto to_string(handler_id id) noexcept -> std::string_view {
    switch (id) {
        case handler_id::list_local:
            return "list_local";
        case handler_id::list_remote:
            return "list_remote";
        case handler_id::upload_file:
            return "upload_file";
        case handler_id::download_file:
            return "download_file";
        case handler_id::upload_directory:
            return "upload_directory";
        case handler_id::download_directory:
            return "download_directory";
        case handler_id::delete_file:
            return "delete_file";
        case handler_id::delete_directory:
            return "delete_directory";
        case handler_id::list_peripherals:
            return "list_peripherals";
        default:
            return "unknown";
    }
}

[[nodiscard]] auto handler_from_string(std::string_view name) -> std::optional<handler_id>;

/**
 * @brief Streamed handlers publish START / PROGRESS / terminal envelopes
 */
[[nodiscard]] constexpr auto is_streamed(handler_id id) noexcept -> bool {
    return id == handler_id::upload_file || id == handler_id::download_file ||
           id == handler_id::upload_directory || id == handler_id::download_directory;
}

/**
 * @brief Base binding set of a deployment
 *
 * Code 63 means DELETE_REMOTE_FILE in the standard profile and
 * DOWNLOAD_FILE in the legacy one. Neither profile binds both handlers to
 * it.
 */
enum class action_profile {
    standard,
    legacy,
};

[[nodiscard]] auto action_profile_from_string(std::string_view name)
    -> std::optional<action_profile>;

/**
 * @brief Immutable code -> handler table
 *
 * @code
 * auto table = action_table::build(action_profile::standard, {{"download_file", 69}});
 * @endcode
 */
class action_table {
public:
    /**
     * @brief Build a table from a profile plus per-handler overrides
     *
     * An override moves its handler to a new code. Overrides are applied
     * together, so two handlers may swap codes.
     *
     * @return the table, invalid_configuration for an unknown handler name
     *         or a non-positive code, action_code_collision when two
     *         handlers end up on one code
     */
    [[nodiscard]] static auto build(action_profile profile,
                                    const std::map<std::string, int32_t>& overrides = {})
        -> result<action_table>;

    [[nodiscard]] auto resolve(int32_t code) const -> std::optional<handler_id>;
    [[nodiscard]] auto code_of(handler_id id) const -> std::optional<int32_t>;

    [[nodiscard]] auto bindings() const -> const std::map<int32_t, handler_id>& {
        return bindings_;
    }

private:
    action_table() = default;

    std::map<int32_t, handler_id> bindings_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_SERVICE_ACTION_TABLE_H
