#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <core/model/device_type.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/mdns/service_event.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace castscout::core {

// "<service type>:<host without .local>:<port>"
std::string MakeMdnsDeviceId(std::string_view service_type, std::string_view hostname, uint16_t port);

/**
 * @brief Turns the browse events of one mDNS service type into registry updates.
 *
 * @details Removal events are logged only; devices leave the registry through the stale
 * reaper because goodbye packets are frequently lost. A resolution without an address is
 * skipped. The loop ends when the channel is closed or Cancel() is called.
 */
class MdnsWatcher {
public:
    MdnsWatcher(DeviceType device_type,
                std::shared_ptr<mdns::ServiceEventChannel> events,
                DeviceRegistry& registry);

    boost::asio::awaitable<void> Run();
    void Cancel();

    void HandleEvent(const mdns::ServiceEvent& event);

    const DeviceType& device_type() const { return device_type_; }

private:
    void handleResolved(const mdns::ServiceInfo& info);

    DeviceType device_type_;
    std::string service_type_;
    std::shared_ptr<mdns::ServiceEventChannel> events_;
    DeviceRegistry& registry_;
    bool cancelled_{false};
};

} // namespace castscout::core
