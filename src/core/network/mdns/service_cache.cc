#include <algorithm>
#include <cctype>
#include <core/network/mdns/service_cache.h>
#include <set>

namespace castscout::core::mdns {

namespace {

ServiceCache::TimePoint expiryOf(const ResourceRecord& record, ServiceCache::TimePoint now) {
    return now + std::chrono::seconds(record.ttl);
}

} // namespace

std::string CanonicalName(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (out.empty() || out.back() != '.') {
        out.push_back('.');
    }
    return out;
}

void ServiceCache::Watch(const std::string& service_type) {
    watched_.emplace(CanonicalName(service_type), service_type);
}

std::vector<std::string> ServiceCache::WatchedServices() const {
    std::vector<std::string> services;
    for (const auto& [_, service_type] : watched_) {
        services.push_back(service_type);
    }
    return services;
}

void ServiceCache::Clear() {
    watched_.clear();
    instances_.clear();
    host_addresses_.clear();
}

ServiceCache::Update ServiceCache::Apply(const DnsMessage& message, TimePoint now) {
    Update update;
    if (!message.IsResponse()) {
        return update;
    }
    expire(now, update);

    std::set<std::string> addressed_before;
    for (const auto& [host, entries] : host_addresses_) {
        if (!entries.empty()) {
            addressed_before.insert(host);
        }
    }

    std::set<std::string> touched_instances;
    for (const auto& record : message.records) {
        if (record.type != record_type::kPtr) {
            continue;
        }
        auto watched = watched_.find(CanonicalName(record.name));
        if (watched == watched_.end()) {
            continue;
        }
        const auto& service_type = watched->second;
        auto key = CanonicalName(record.ptr_name);
        if (record.ttl == 0) {
            // goodbye packet
            if (instances_.erase(key) > 0) {
                update.events.emplace_back(ServiceRemoved{service_type, record.ptr_name});
            }
            touched_instances.erase(key);
            continue;
        }
        auto& instance = instances_[key];
        instance.service_type = service_type;
        instance.fullname = record.ptr_name;
        instance.expires = expiryOf(record, now);
        touched_instances.insert(key);
    }

    for (const auto& record : message.records) {
        if (record.type != record_type::kSrv && record.type != record_type::kTxt) {
            continue;
        }
        auto it = instances_.find(CanonicalName(record.name));
        if (it == instances_.end()) {
            continue;
        }
        auto& instance = it->second;
        if (record.type == record_type::kSrv) {
            if (record.ttl == 0) {
                instance.srv.reset();
                continue;
            }
            instance.srv = record.srv;
            instance.srv_expires = expiryOf(record, now);
        } else {
            if (record.ttl == 0) {
                continue;
            }
            instance.properties = ParseTxtProperties(record.txt);
        }
        touched_instances.insert(it->first);
    }

    for (const auto& record : message.records) {
        if (record.type == record_type::kA || record.type == record_type::kAaaa) {
            storeAddress(record, now);
        }
    }

    for (const auto& [key, instance] : instances_) {
        if (!instance.srv) {
            continue;
        }
        auto host = CanonicalName(instance.srv->target);
        auto entries = host_addresses_.find(host);
        if (entries != host_addresses_.end() && !entries->second.empty()
            && addressed_before.count(host) == 0) {
            touched_instances.insert(key);
        }
    }

    for (const auto& key : touched_instances) {
        const auto& instance = instances_.at(key);
        if (!instance.srv) {
            continue;
        }
        auto host = host_addresses_.find(CanonicalName(instance.srv->target));
        if (host == host_addresses_.end() || host->second.empty()) {
            update.unresolved_hosts.push_back(instance.srv->target);
            continue;
        }
        ServiceInfo info;
        info.service_type = instance.service_type;
        info.fullname = instance.fullname;
        info.hostname = instance.srv->target;
        info.port = instance.srv->port;
        for (const auto& entry : host->second) {
            info.addresses.push_back(entry.address);
        }
        info.properties = instance.properties;
        update.events.emplace_back(ServiceResolved{std::move(info)});
    }
    return update;
}

void ServiceCache::expire(TimePoint now, Update& update) {
    for (auto it = instances_.begin(); it != instances_.end();) {
        auto& instance = it->second;
        if (instance.expires <= now) {
            update.events.emplace_back(ServiceRemoved{instance.service_type, instance.fullname});
            it = instances_.erase(it);
            continue;
        }
        if (instance.srv && instance.srv_expires <= now) {
            instance.srv.reset();
        }
        ++it;
    }

    for (auto it = host_addresses_.begin(); it != host_addresses_.end();) {
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(),
                                     entries.end(),
                                     [now](const CachedAddress& entry) { return entry.expires <= now; }),
                      entries.end());
        if (entries.empty() || !isSrvTarget(it->first)) {
            it = host_addresses_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ServiceCache::isSrvTarget(const std::string& host) const {
    return std::any_of(instances_.begin(), instances_.end(), [&](const auto& entry) {
        return entry.second.srv && CanonicalName(entry.second.srv->target) == host;
    });
}

void ServiceCache::storeAddress(const ResourceRecord& record, TimePoint now) {
    auto host = CanonicalName(record.name);
    if (!isSrvTarget(host)) {
        return;
    }
    auto& entries = host_addresses_[host];
    auto same_address = [&](const CachedAddress& entry) { return entry.address == record.address; };

    if (record.ttl == 0) {
        entries.erase(std::remove_if(entries.begin(), entries.end(), same_address), entries.end());
        return;
    }
    if (record.cache_flush) {
        // RFC 6762 10.2: same name and type, received more than one second ago
        bool v4 = record.address.is_v4();
        entries.erase(std::remove_if(entries.begin(),
                                     entries.end(),
                                     [&](const CachedAddress& entry) {
                                         return entry.address.is_v4() == v4
                                                && entry.address != record.address
                                                && now - entry.received > std::chrono::seconds(1);
                                     }),
                      entries.end());
    }

    if (auto it = std::find_if(entries.begin(), entries.end(), same_address); it != entries.end()) {
        it->received = now;
        it->expires = expiryOf(record, now);
        return;
    }
    CachedAddress entry{record.address, now, expiryOf(record, now)};
    if (record.address.is_v4()) {
        // IPv4 first, receivers are usually reachable on it
        auto first_v6 = std::find_if(entries.begin(), entries.end(), [](const CachedAddress& e) {
            return e.address.is_v6();
        });
        entries.insert(first_v6, entry);
    } else {
        entries.push_back(entry);
    }
}

} // namespace castscout::core::mdns
