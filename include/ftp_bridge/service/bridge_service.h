/**
 * @file bridge_service.h
 * @brief One worker per peripheral over a shared broker
 */

#ifndef FTP_BRIDGE_SERVICE_BRIDGE_SERVICE_H
#define FTP_BRIDGE_SERVICE_BRIDGE_SERVICE_H

#include <memory>

#include <ftp_bridge/broker/message_broker.h>
#include <ftp_bridge/config/bridge_config.h>
#include <ftp_bridge/core/types.h>
#include <ftp_bridge/ftp/ftp_session.h>
#include <ftp_bridge/history/history_sink.h>
#include <ftp_bridge/protocol/response_builder.h>
#include <ftp_bridge/registry/peripheral_registry.h>

namespace ftp_bridge {

/**
 * @brief Bridge service
 *
 * Owns the registry and one peripheral_worker per configured peripheral.
 * Workers share the broker, the session factory and the history sink;
 * nothing else is shared between peripherals.
 *
 * @code
 * auto service = bridge_service::builder()
 *     .with_config(config)
 *     .with_broker(broker)
 *     .build();
 *
 * if (service.has_value()) {
 *     service.value().start();
 * }
 * @endcode
 */
class bridge_service {
public:
    /**
     * @brief Builder for bridge_service
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the configuration (peripherals included)
         * @return Reference to builder for chaining
         */
        auto with_config(bridge_config config) -> builder&;

        /**
         * @brief Add one peripheral to the configuration
         * @return Reference to builder for chaining
         */
        auto with_peripheral(peripheral_ref peripheral) -> builder&;

        /**
         * @brief Set the broker (default: in_memory_broker)
         * @return Reference to builder for chaining
         */
        auto with_broker(std::shared_ptr<message_broker> broker) -> builder&;

        /**
         * @brief Set the session factory (default: curl_session_factory)
         * @return Reference to builder for chaining
         */
        auto with_session_factory(std::shared_ptr<session_factory> factory) -> builder&;

        /**
         * @brief Set the history sink (default: from history_file)
         * @return Reference to builder for chaining
         */
        auto with_history_sink(std::shared_ptr<history_sink> sink) -> builder&;

        /**
         * @brief Set the response timestamp source
         * @return Reference to builder for chaining
         */
        auto with_clock(clock_fn clock) -> builder&;

        /**
         * @brief Validate and build the service
         * @return the service, or invalid_configuration / action_code_collision
         */
        [[nodiscard]] auto build() -> result<bridge_service>;

    private:
        bridge_config config_;
        std::shared_ptr<message_broker> broker_;
        std::shared_ptr<session_factory> sessions_;
        std::shared_ptr<history_sink> history_;
        clock_fn clock_;
    };

    ~bridge_service();

    bridge_service(const bridge_service&) = delete;
    auto operator=(const bridge_service&) -> bridge_service& = delete;
    bridge_service(bridge_service&&) noexcept;
    auto operator=(bridge_service&&) noexcept -> bridge_service&;

    /**
     * @brief Start one worker per registered peripheral
     * @return invalid_configuration when no peripheral is registered
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop every worker; commands in progress finish first
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto worker_count() const -> std::size_t;

    [[nodiscard]] auto registry() const -> const peripheral_registry&;
    [[nodiscard]] auto broker() -> message_broker&;
    [[nodiscard]] auto history() const -> std::shared_ptr<history_sink>;
    [[nodiscard]] auto config() const -> const bridge_config&;

private:
    struct impl;
    explicit bridge_service(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace ftp_bridge

#endif  // FTP_BRIDGE_SERVICE_BRIDGE_SERVICE_H
