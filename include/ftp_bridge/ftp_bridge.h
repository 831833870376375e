/**
 * @file ftp_bridge.h
 * @brief Main header for the ftp_bridge library
 * @version 0.1.0
 *
 * Include this header to access the bridge service and its building blocks.
 *
 * @code
 * #include <ftp_bridge/ftp_bridge.h>
 *
 * using namespace ftp_bridge;
 *
 * auto config = load_bridge_config("bridge.json");
 * auto service = bridge_service::builder()
 *     .with_config(config.value())
 *     .build();
 * @endcode
 */

#ifndef FTP_BRIDGE_FTP_BRIDGE_H
#define FTP_BRIDGE_FTP_BRIDGE_H

#include <cstdint>
#include <string>

// Core
#include <ftp_bridge/core/error_codes.h>
#include <ftp_bridge/core/json_codec.h>
#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/core/types.h>

// Protocol
#include <ftp_bridge/protocol/action_codes.h>
#include <ftp_bridge/protocol/envelope.h>
#include <ftp_bridge/protocol/response_builder.h>

// Transfer
#include <ftp_bridge/engine/transfer_engine.h>
#include <ftp_bridge/ftp/connection_manager.h>
#include <ftp_bridge/ftp/curl_ftp_session.h>
#include <ftp_bridge/listing/local_listing.h>
#include <ftp_bridge/listing/remote_listing.h>

// Service
#include <ftp_bridge/broker/in_memory_broker.h>
#include <ftp_bridge/config/bridge_config.h>
#include <ftp_bridge/history/history_sink.h>
#include <ftp_bridge/service/bridge_service.h>

namespace ftp_bridge {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_FTP_BRIDGE_H
