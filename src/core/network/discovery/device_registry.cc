#include <core/network/discovery/device_registry.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace castscout::core {

bool DeviceRegistry::Upsert(const std::string& id, const DeviceFactory& factory) {
    std::optional<DiscoveredDevice> inserted;
    {
        std::unique_lock lock(mutex_);
        if (auto it = devices_.find(id); it != devices_.end()) {
            it->second.UpdateLastSeen();
            return false;
        }
        auto [it, _] = devices_.emplace(id, factory());
        inserted = it->second;
    }

    spdlog::info("Device found: {} ({}:{})", inserted->name, inserted->ip.to_string(), inserted->port);
    std::function<void(const DiscoveredDevice&)> callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = device_found_callback_;
    }
    if (callback) {
        callback(*inserted);
    }
    return true;
}

bool DeviceRegistry::Remove(const std::string& id) {
    return RemoveIf(id, [](const DiscoveredDevice&) { return true; });
}

bool DeviceRegistry::RemoveIf(const std::string& id,
                              const std::function<bool(const DiscoveredDevice&)>& predicate) {
    {
        std::unique_lock lock(mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end() || !predicate(it->second)) {
            return false;
        }
        devices_.erase(it);
    }

    spdlog::info("Device lost: {}", id);
    std::function<void(std::string_view)> callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = device_lost_callback_;
    }
    if (callback) {
        callback(id);
    }
    return true;
}

std::vector<DiscoveredDevice> DeviceRegistry::GetAll() const {
    std::shared_lock lock(mutex_);
    std::vector<DiscoveredDevice> devices;
    devices.reserve(devices_.size());
    for (const auto& [_, device] : devices_) {
        devices.push_back(device);
    }
    return devices;
}

std::vector<DiscoveredDevice> DeviceRegistry::GetByType(const DeviceType& type) const {
    std::shared_lock lock(mutex_);
    std::vector<DiscoveredDevice> devices;
    for (const auto& [_, device] : devices_) {
        if (device.device_type == type) {
            devices.push_back(device);
        }
    }
    return devices;
}

std::optional<DiscoveredDevice> DeviceRegistry::GetByID(const std::string& id) const {
    std::shared_lock lock(mutex_);
    if (auto it = devices_.find(id); it != devices_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::size_t DeviceRegistry::Size() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::SetDeviceFoundCallback(std::function<void(const DiscoveredDevice&)> callback) {
    std::lock_guard lock(callback_mutex_);
    device_found_callback_ = std::move(callback);
}

void DeviceRegistry::SetDeviceLostCallback(std::function<void(std::string_view)> callback) {
    std::lock_guard lock(callback_mutex_);
    device_lost_callback_ = std::move(callback);
}

} // namespace castscout::core
