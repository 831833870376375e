/**
 * @file bridge_config.h
 * @brief Bridge configuration and its JSON loader
 */

#ifndef FTP_BRIDGE_CONFIG_BRIDGE_CONFIG_H
#define FTP_BRIDGE_CONFIG_BRIDGE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/types.h>
#include <ftp_bridge/engine/transfer_types.h>
#include <ftp_bridge/ftp/ftp_session.h>
#include <ftp_bridge/registry/peripheral_registry.h>
#include <ftp_bridge/service/action_table.h>

namespace ftp_bridge {

/// Chunk size bounds
inline constexpr std::size_t min_chunk_size = 4 * 1024;
inline constexpr std::size_t max_chunk_size = 4 * 1024 * 1024;

struct logging_config {
    log_level level = log_level::info;
    bool json = false;
    bool mask_sensitive = false;
};

/**
 * @brief Everything a bridge_service needs besides its collaborators
 */
struct bridge_config {
    engine_options engine;
    connection_options connection;
    action_profile profile = action_profile::standard;
    std::map<std::string, int32_t> action_overrides;
    /// Empty: keep history in memory
    std::filesystem::path history_file;
    logging_config logging;
    std::chrono::milliseconds poll_interval{500};
    std::vector<peripheral_ref> peripherals;
};

/**
 * @brief Check ranges and uniqueness
 * @return invalid_configuration naming the offending key
 */
[[nodiscard]] auto validate(const bridge_config& config) -> result<void>;

/**
 * @brief Parse configuration from JSON text
 */
[[nodiscard]] auto parse_bridge_config(std::string_view text) -> result<bridge_config>;

/**
 * @brief Load configuration from a JSON file
 */
[[nodiscard]] auto load_bridge_config(const std::filesystem::path& file) -> result<bridge_config>;

/**
 * @brief Apply the logging section to the process-wide logger
 */
void apply_logging_config(const logging_config& config);

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_CONFIG_BRIDGE_CONFIG_H
