#include <utility>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/discovery/ssdp_watcher.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace castscout::core {

SsdpWatcher::SsdpWatcher(io_context& ioc,
                         std::unique_ptr<ssdp::SsdpSearcher> searcher,
                         DeviceRegistry& registry,
                         SsdpWatcherOptions options)
    : searcher_(std::move(searcher))
    , registry_(registry)
    , options_(options)
    , poll_timer_(ioc) {}

awaitable<void> SsdpWatcher::Run() {
    spdlog::info("Starting UPnP/SSDP discovery");
    while (!cancelled_) {
        co_await Scan();
        if (cancelled_) {
            break;
        }
        poll_timer_.expires_after(options_.poll_interval);
        boost::system::error_code ec;
        co_await poll_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec) {
            break;
        }
    }
    spdlog::debug("SSDP watcher finished");
}

void SsdpWatcher::Cancel() {
    cancelled_ = true;
    poll_timer_.cancel();
    searcher_->Cancel();
}

awaitable<std::size_t> SsdpWatcher::Scan() {
    const std::pair<std::string_view, DeviceType> searches[] = {
        {ssdp::kRootDevice, DeviceType::Kind::kUpnp},
        {ssdp::kMediaRenderer, DeviceType::Kind::kDlna},
    };

    std::size_t accepted = 0;
    for (const auto& [target, device_type] : searches) {
        if (cancelled_) {
            break;
        }
        std::vector<ssdp::SsdpResponse> responses;
        try {
            responses = co_await searcher_->Search(std::string(target),
                                                   options_.search_timeout,
                                                   options_.retransmissions);
        } catch (const std::exception& e) {
            spdlog::warn("SSDP search for {} failed: {}", target, e.what());
            continue;
        }
        if (cancelled_) {
            break;
        }
        for (const auto& response : responses) {
            if (HandleResponse(response, device_type)) {
                ++accepted;
            }
        }
    }
    co_return accepted;
}

bool SsdpWatcher::HandleResponse(const ssdp::SsdpResponse& response, const DeviceType& device_type) {
    auto location = ssdp::ParseLocation(response.location);
    if (!location) {
        spdlog::warn("Skipping SSDP response with unparseable location: {}", response.location);
        return false;
    }
    boost::system::error_code ec;
    auto ip = ip::make_address(location->host, ec);
    if (ec) {
        spdlog::warn("Skipping SSDP response with non-IP host: {}", location->host);
        return false;
    }

    bool is_dlna = device_type.kind() == DeviceType::Kind::kDlna;
    auto id = fmt::format("{}:{}:{}", is_dlna ? "dlna" : "upnp", ip.to_string(), location->port);
    auto name = is_dlna ? fmt::format("DLNA Renderer at {}", location->host)
                        : fmt::format("UPnP Device at {}", location->host);

    registry_.Upsert(id, [&] {
        DiscoveredDevice device(id, name, device_type, ip, location->port);
        device.metadata = {
            {"location", response.location},
            {"server", response.server},
        };
        if (is_dlna) {
            device.metadata.emplace("device_type", "MediaRenderer");
        } else {
            device.metadata.emplace("search_target", response.search_target);
        }
        return device;
    });
    return true;
}

} // namespace castscout::core
