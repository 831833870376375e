/**
 * @file bridge_service.cpp
 * @brief Bridge service implementation
 */

#include <ftp_bridge/service/bridge_service.h>

#include <mutex>
#include <vector>

#include <ftp_bridge/broker/in_memory_broker.h>
#include <ftp_bridge/core/logging.h>
#include <ftp_bridge/ftp/curl_ftp_session.h>
#include <ftp_bridge/service/action_table.h>
#include <ftp_bridge/service/peripheral_worker.h>

namespace ftp_bridge {

struct bridge_service::impl {
    bridge_config config;
    action_table table;
    static_peripheral_registry registry;
    std::shared_ptr<message_broker> broker;
    std::shared_ptr<session_factory> sessions;
    std::shared_ptr<history_sink> history;
    clock_fn clock;

    std::vector<std::unique_ptr<peripheral_worker>> workers;
    std::mutex mutex;
    bool running = false;

    impl(bridge_config cfg, action_table tbl) : config(std::move(cfg)), table(std::move(tbl)) {}
};

// ============================================================================
// builder
// ============================================================================

bridge_service::builder::builder() = default;

auto bridge_service::builder::with_config(bridge_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto bridge_service::builder::with_peripheral(peripheral_ref peripheral) -> builder& {
    config_.peripherals.push_back(std::move(peripheral));
    return *this;
}

auto bridge_service::builder::with_broker(std::shared_ptr<message_broker> broker) -> builder& {
    broker_ = std::move(broker);
    return *this;
}

auto bridge_service::builder::with_session_factory(std::shared_ptr<session_factory> factory)
    -> builder& {
    sessions_ = std::move(factory);
    return *this;
}

auto bridge_service::builder::with_history_sink(std::shared_ptr<history_sink> sink)
    -> builder& {
    history_ = std::move(sink);
    return *this;
}

auto bridge_service::builder::with_clock(clock_fn clock) -> builder& {
    clock_ = std::move(clock);
    return *this;
}

auto bridge_service::builder::build() -> result<bridge_service> {
    if (auto valid = validate(config_); !valid) {
        return unexpected{valid.error()};
    }
    auto table = action_table::build(config_.profile, config_.action_overrides);
    if (!table) {
        return unexpected{table.error()};
    }

    auto state = std::make_unique<impl>(config_, std::move(table.value()));
    for (const auto& peripheral : config_.peripherals) {
        if (auto added = state->registry.add(peripheral); !added) {
            return unexpected{added.error()};
        }
    }

    state->broker = broker_ ? broker_ : std::make_shared<in_memory_broker>();
    state->sessions =
        sessions_ ? sessions_ : std::make_shared<curl_session_factory>(config_.connection);
    if (history_) {
        state->history = history_;
    } else if (!config_.history_file.empty()) {
        state->history = std::make_shared<jsonl_history_sink>(config_.history_file);
    } else {
        state->history = std::make_shared<memory_history_sink>();
    }
    state->clock = clock_ ? clock_ : clock_fn{system_clock_seconds};

    FB_LOG_INFO(log_category::service,
                "Bridge configured with " + std::to_string(config_.peripherals.size()) +
                    " peripherals");
    return bridge_service(std::move(state));
}

// ============================================================================
// bridge_service
// ============================================================================

bridge_service::bridge_service(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

bridge_service::~bridge_service() {
    if (impl_) {
        stop();
    }
}

bridge_service::bridge_service(bridge_service&&) noexcept = default;
auto bridge_service::operator=(bridge_service&&) noexcept -> bridge_service& = default;

auto bridge_service::start() -> result<void> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->running) {
        return {};
    }

    auto peripherals = impl_->registry.list();
    if (peripherals.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "peripherals: at least one peripheral is required"}};
    }

    for (const auto& peripheral : peripherals) {
        action_dispatcher::collaborators deps{impl_->registry, *impl_->broker, impl_->history,
                                              impl_->sessions};
        auto dispatcher = std::make_unique<action_dispatcher>(
            peripheral.index, deps, impl_->table, impl_->config.connection,
            impl_->config.engine, response_builder{impl_->clock});
        impl_->workers.push_back(std::make_unique<peripheral_worker>(
            peripheral.inbound(), *impl_->broker, std::move(dispatcher),
            impl_->config.poll_interval));
    }
    for (auto& worker : impl_->workers) {
        worker->start();
    }
    impl_->running = true;
    return {};
}

void bridge_service::stop() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->running) {
        return;
    }
    for (auto& worker : impl_->workers) {
        worker->stop();
    }
    impl_->workers.clear();
    impl_->running = false;
    FB_LOG_INFO(log_category::service, "Bridge stopped");
}

auto bridge_service::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->running;
}

auto bridge_service::worker_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->workers.size();
}

auto bridge_service::registry() const -> const peripheral_registry& {
    return impl_->registry;
}

auto bridge_service::broker() -> message_broker& {
    return *impl_->broker;
}

auto bridge_service::history() const -> std::shared_ptr<history_sink> {
    return impl_->history;
}

auto bridge_service::config() const -> const bridge_config& {
    return impl_->config;
}

}  // namespace ftp_bridge
