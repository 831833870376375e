/**
 * @file peripheral_registry.cpp
 * @brief In-process peripheral registry
 */

#include <ftp_bridge/registry/peripheral_registry.h>

#include <mutex>

namespace ftp_bridge {

auto default_inbound_queue(int32_t index) -> std::string {
    return "recv_queue_index_" + std::to_string(index);
}

auto default_outbound_queue(int32_t index) -> std::string {
    return "send_queue_index_" + std::to_string(index);
}

auto peripheral_ref::inbound() const -> std::string {
    return inbound_queue.empty() ? default_inbound_queue(index) : inbound_queue;
}

auto peripheral_ref::outbound() const -> std::string {
    return outbound_queue.empty() ? default_outbound_queue(index) : outbound_queue;
}

static_peripheral_registry::static_peripheral_registry(
    const std::vector<peripheral_ref>& peripherals) {
    for (const auto& p : peripherals) {
        peripherals_.insert_or_assign(p.index, p);
    }
}

auto static_peripheral_registry::add(peripheral_ref peripheral) -> result<void> {
    std::unique_lock lock(mutex_);
    auto index = peripheral.index;
    auto [it, inserted] = peripherals_.emplace(index, std::move(peripheral));
    if (!inserted) {
        return unexpected{error{error_code::invalid_configuration,
                                "Duplicate peripheral index " + std::to_string(index)}};
    }
    return {};
}

auto static_peripheral_registry::remove(int32_t index) -> bool {
    std::unique_lock lock(mutex_);
    return peripherals_.erase(index) > 0;
}

auto static_peripheral_registry::find(int32_t index) const -> result<peripheral_ref> {
    std::shared_lock lock(mutex_);
    auto it = peripherals_.find(index);
    if (it == peripherals_.end()) {
        return unexpected{error{error_code::peripheral_not_found,
                                "No peripheral with index " + std::to_string(index)}};
    }
    return it->second;
}

auto static_peripheral_registry::list() const -> std::vector<peripheral_ref> {
    std::shared_lock lock(mutex_);
    std::vector<peripheral_ref> out;
    out.reserve(peripherals_.size());
    for (const auto& [index, p] : peripherals_) {
        out.push_back(p);
    }
    return out;
}

}  // namespace ftp_bridge
