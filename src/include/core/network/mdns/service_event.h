#pragma once

#include <utility>
#include <boost/asio/ip/address.hpp>
#include <core/util/event_channel.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace castscout::core::mdns {

// A fully resolved service instance: SRV, TXT and at least one address of the target host.
struct ServiceInfo {
    std::string service_type; // "_googlecast._tcp.local."
    std::string fullname;     // "Living Room._googlecast._tcp.local."
    std::string hostname;     // "livingroom.local."
    uint16_t port = 0;
    std::vector<boost::asio::ip::address> addresses;
    std::map<std::string, std::string> properties; // TXT key/value pairs
};

struct SearchStarted {
    std::string service_type;
};

struct ServiceResolved {
    ServiceInfo info;
};

struct ServiceRemoved {
    std::string service_type;
    std::string fullname;
};

using ServiceEvent = std::variant<SearchStarted, ServiceResolved, ServiceRemoved>;
using ServiceEventChannel = EventChannel<ServiceEvent>;

} // namespace castscout::core::mdns
