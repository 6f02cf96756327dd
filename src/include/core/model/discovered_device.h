#pragma once

#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <core/model/device_capabilities.h>
#include <core/model/device_type.h>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace castscout::core {

using Clock = std::chrono::system_clock;

struct DiscoveredDevice {
    std::string id; // derived from (service type, host, port)
    std::string name;
    DeviceType device_type;
    boost::asio::ip::address ip;
    uint16_t port = 0;
    DeviceCapabilities capabilities;
    Clock::time_point discovered_at;
    Clock::time_point last_seen;
    std::map<std::string, std::string> metadata; // TXT records or SSDP headers

    DiscoveredDevice(std::string id,
                     std::string name,
                     DeviceType device_type,
                     boost::asio::ip::address ip,
                     uint16_t port,
                     Clock::time_point now = Clock::now());

    void UpdateLastSeen(Clock::time_point now = Clock::now());

    bool IsStale(Clock::duration timeout, Clock::time_point now = Clock::now()) const {
        return now - last_seen > timeout;
    }
};

void to_json(nlohmann::json& j, const DiscoveredDevice& device);

// RFC 3339, UTC, second precision: 2024-05-01T12:00:00Z
std::string FormatTimestamp(Clock::time_point time);

} // namespace castscout::core
