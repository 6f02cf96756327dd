#pragma once

#include <core/model/discovered_device.h>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace castscout::core {

/**
 * @brief Thread-safe id -> DiscoveredDevice store shared by every discovery task.
 *
 * @details Watchers insert or refresh records, the reaper removes them and API callers
 * read snapshots, all concurrently. Readers only ever receive copies of fully built
 * records. Found/lost callbacks run on the mutating thread after the lock is released.
 */
class DeviceRegistry {
public:
    using DeviceFactory = std::function<DiscoveredDevice()>;

    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Inserts a device built by @p factory when @p id is unknown, otherwise only
     * refreshes the last_seen timestamp of the existing record.
     *
     * @return true if a new record was inserted
     */
    bool Upsert(const std::string& id, const DeviceFactory& factory);

    bool Remove(const std::string& id);

    // Removes the record only if @p predicate holds for it under the write lock.
    bool RemoveIf(const std::string& id, const std::function<bool(const DiscoveredDevice&)>& predicate);

    std::vector<DiscoveredDevice> GetAll() const;
    std::vector<DiscoveredDevice> GetByType(const DeviceType& type) const;
    std::optional<DiscoveredDevice> GetByID(const std::string& id) const;
    std::size_t Size() const;

    void SetDeviceFoundCallback(std::function<void(const DiscoveredDevice&)> callback);
    void SetDeviceLostCallback(std::function<void(std::string_view)> callback);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DiscoveredDevice> devices_;

    std::mutex callback_mutex_;
    std::function<void(const DiscoveredDevice&)> device_found_callback_ = nullptr;
    std::function<void(std::string_view)> device_lost_callback_ = nullptr;
};

} // namespace castscout::core
