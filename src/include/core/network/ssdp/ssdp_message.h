#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace castscout::core::ssdp {

inline constexpr std::string_view kRootDevice = "upnp:rootdevice";
inline constexpr std::string_view kMediaRenderer = "urn:schemas-upnp-org:device:MediaRenderer:1";

struct SsdpResponse {
    std::string location;
    std::string server;
    std::string search_target; // ST
    std::string usn;
};

struct Location {
    std::string scheme;
    std::string host; // brackets stripped for IPv6 literals
    uint16_t port = 0;
    std::string path;
};

std::string BuildSearchRequest(std::string_view search_target, std::chrono::seconds mx);

// Returns std::nullopt unless the datagram is a 200 OK search response carrying LOCATION.
std::optional<SsdpResponse> ParseSsdpResponse(std::string_view datagram);

// http://192.168.1.20:49152/description.xml; the port defaults by scheme (80/443).
std::optional<Location> ParseLocation(std::string_view url);

} // namespace castscout::core::ssdp
