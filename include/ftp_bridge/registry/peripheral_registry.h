/**
 * @file peripheral_registry.h
 * @brief Read-only lookup of configured file-transfer peripherals
 */

#ifndef FTP_BRIDGE_REGISTRY_PERIPHERAL_REGISTRY_H
#define FTP_BRIDGE_REGISTRY_PERIPHERAL_REGISTRY_H

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <ftp_bridge/core/types.h>

namespace ftp_bridge {

/**
 * @brief One FTP/FTPS endpoint addressed by an integer index
 *
 * Credentials are read per operation and never logged.
 */
struct peripheral_ref {
    int32_t index = 0;
    std::string name;
    endpoint server;
    std::string user = "anonymous";
    std::string password;
    bool use_tls = false;

    /// Local side default for listings and legacy downloads
    std::string local_root = "./";
    /// Remote side default for listings and legacy uploads
    std::string remote_root;

    std::string inbound_queue;
    std::string outbound_queue;

    [[nodiscard]] auto inbound() const -> std::string;
    [[nodiscard]] auto outbound() const -> std::string;
};

/**
 * @brief Default inbound queue name: recv_queue_index_<N>
 */
[[nodiscard]] auto default_inbound_queue(int32_t index) -> std::string;

/**
 * @brief Default outbound queue name: send_queue_index_<N>
 */
[[nodiscard]] auto default_outbound_queue(int32_t index) -> std::string;

/**
 * @brief Registry interface
 *
 * Implementations must be safe for concurrent reads from every
 * peripheral worker.
 */
class peripheral_registry {
public:
    virtual ~peripheral_registry() = default;

    [[nodiscard]] virtual auto find(int32_t index) const -> result<peripheral_ref> = 0;

    /**
     * @brief All peripherals ordered by index
     */
    [[nodiscard]] virtual auto list() const -> std::vector<peripheral_ref> = 0;
};

/**
 * @brief Registry backed by an in-process map
 *
 * Filled from configuration at startup. Writers take an exclusive lock,
 * lookups a shared one.
 */
class static_peripheral_registry : public peripheral_registry {
public:
    static_peripheral_registry() = default;
    explicit static_peripheral_registry(const std::vector<peripheral_ref>& peripherals);

    /**
     * @brief Add a peripheral
     * @return invalid_configuration if the index is already registered
     */
    [[nodiscard]] auto add(peripheral_ref peripheral) -> result<void>;

    [[nodiscard]] auto remove(int32_t index) -> bool;

    [[nodiscard]] auto find(int32_t index) const -> result<peripheral_ref> override;
    [[nodiscard]] auto list() const -> std::vector<peripheral_ref> override;

private:
    std::map<int32_t, peripheral_ref> peripherals_;
    mutable std::shared_mutex mutex_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_REGISTRY_PERIPHERAL_REGISTRY_H
