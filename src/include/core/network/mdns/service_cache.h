#pragma once

#include <utility>
#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <core/network/mdns/dns_message.h>
#include <core/network/mdns/service_event.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace castscout::core::mdns {

/**
 * @brief Record cache that turns mDNS responses into browse events.
 *
 * @details Tracks PTR instances of the watched service types together with their SRV,
 * TXT and the addresses of their SRV target hosts; addresses of any other host are
 * dropped. Every record expires after its TTL, expired instances are reported as
 * removed. An instance is reported as resolved when a response refreshes its PTR, SRV
 * or TXT record while an address is known, or when the first address of its target
 * arrives. Address refreshes alone never re-report an instance.
 */
class ServiceCache {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct Update {
        std::vector<ServiceEvent> events;
        std::vector<std::string> unresolved_hosts; // SRV targets with no known address
    };

    void Watch(const std::string& service_type);
    std::vector<std::string> WatchedServices() const;

    Update Apply(const DnsMessage& message, TimePoint now = std::chrono::steady_clock::now());
    void Clear();

    std::size_t InstanceCount() const { return instances_.size(); }
    std::size_t HostCount() const { return host_addresses_.size(); }

private:
    struct Instance {
        std::string service_type;
        std::string fullname;
        TimePoint expires;
        std::optional<SrvData> srv;
        TimePoint srv_expires;
        std::map<std::string, std::string> properties;
    };

    struct CachedAddress {
        boost::asio::ip::address address;
        TimePoint received;
        TimePoint expires;
    };

    void expire(TimePoint now, Update& update);
    bool isSrvTarget(const std::string& host) const;
    void storeAddress(const ResourceRecord& record, TimePoint now);

    // keys are lower-cased DNS names with a trailing dot
    std::map<std::string, std::string> watched_;
    std::map<std::string, Instance> instances_;
    std::map<std::string, std::vector<CachedAddress>> host_addresses_;
};

// Lower-cases a DNS name and makes sure it ends with a dot.
std::string CanonicalName(std::string_view name);

} // namespace castscout::core::mdns
