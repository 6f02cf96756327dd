#include <cctype>
#include <core/network/discovery/mdns_watcher.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace castscout::core {

namespace {

std::string_view trimTrailingDot(std::string_view name) {
    while (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    return name;
}

bool endsWithNoCase(std::string_view text, std::string_view suffix) {
    if (text.size() < suffix.size()) {
        return false;
    }
    auto tail = text.substr(text.size() - suffix.size());
    for (std::size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i]))
            != std::tolower(static_cast<unsigned char>(suffix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string MakeMdnsDeviceId(std::string_view service_type, std::string_view hostname, uint16_t port) {
    auto host = trimTrailingDot(hostname);
    if (endsWithNoCase(host, ".local")) {
        host.remove_suffix(6);
    }
    return fmt::format("{}:{}:{}", service_type, host, port);
}

MdnsWatcher::MdnsWatcher(DeviceType device_type,
                         std::shared_ptr<mdns::ServiceEventChannel> events,
                         DeviceRegistry& registry)
    : device_type_(std::move(device_type))
    , service_type_(device_type_.MdnsService())
    , events_(std::move(events))
    , registry_(registry) {}

boost::asio::awaitable<void> MdnsWatcher::Run() {
    while (!cancelled_) {
        auto event = co_await events_->Receive();
        if (!event || cancelled_) {
            break;
        }
        HandleEvent(*event);
    }
    spdlog::debug("mDNS watcher for {} finished", service_type_);
}

void MdnsWatcher::Cancel() {
    cancelled_ = true;
    events_->Close();
}

void MdnsWatcher::HandleEvent(const mdns::ServiceEvent& event) {
    if (const auto* resolved = std::get_if<mdns::ServiceResolved>(&event); resolved) {
        handleResolved(resolved->info);
    } else if (const auto* removed = std::get_if<mdns::ServiceRemoved>(&event); removed) {
        // left to the stale reaper
        spdlog::info("Service withdrawn: {}", removed->fullname);
    } else if (std::holds_alternative<mdns::SearchStarted>(event)) {
        spdlog::info("mDNS search started for {}", service_type_);
    }
}

void MdnsWatcher::handleResolved(const mdns::ServiceInfo& info) {
    std::string name(trimTrailingDot(info.fullname));
    if (info.addresses.empty()) {
        spdlog::warn("No IP address found for device: {}", name);
        return;
    }

    auto id = MakeMdnsDeviceId(service_type_, info.hostname, info.port);
    const auto& ip = info.addresses.front();
    bool inserted = registry_.Upsert(id, [&] {
        DiscoveredDevice device(id, name, device_type_, ip, info.port);
        device.metadata = info.properties;
        return device;
    });
    if (!inserted) {
        spdlog::debug("Updated device: {} ({}:{})", name, ip.to_string(), info.port);
    }
}

} // namespace castscout::core
