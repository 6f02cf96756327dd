#include <algorithm>
#include <core/network/discovery/capability_resolver.h>
#include <core/model/discovered_device.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace castscout::core {

DiscoveredDevice::DiscoveredDevice(std::string id,
                                   std::string name,
                                   DeviceType device_type,
                                   boost::asio::ip::address ip,
                                   uint16_t port,
                                   Clock::time_point now)
    : id(std::move(id))
    , name(std::move(name))
    , device_type(std::move(device_type))
    , ip(std::move(ip))
    , port(port)
    , capabilities(ResolveCapabilities(this->device_type))
    , discovered_at(now)
    , last_seen(now) {}

void DiscoveredDevice::UpdateLastSeen(Clock::time_point now) {
    // a clock step backwards must not break discovered_at <= last_seen
    last_seen = std::max(now, discovered_at);
}

std::string FormatTimestamp(Clock::time_point time) {
    auto t = Clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void to_json(nlohmann::json& j, const DiscoveredDevice& device) {
    j = nlohmann::json{
        {"id", device.id},
        {"name", device.name},
        {"device_type", device.device_type},
        {"ip", device.ip.to_string()},
        {"port", device.port},
        {"capabilities", device.capabilities},
        {"discovered_at", FormatTimestamp(device.discovered_at)},
        {"last_seen", FormatTimestamp(device.last_seen)},
        {"metadata", device.metadata},
    };
}

} // namespace castscout::core
