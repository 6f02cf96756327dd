#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/model/device_type.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/ssdp/ssdp_searcher.h>
#include <memory>

namespace castscout::core {

struct SsdpWatcherOptions {
    std::chrono::milliseconds poll_interval = std::chrono::seconds(60);
    std::chrono::milliseconds search_timeout = std::chrono::seconds(5);
    int retransmissions = 2;
};

/**
 * @brief Polls the network with SSDP searches for root devices (kUpnp) and media
 * renderers (kDlna).
 *
 * @details Each tick runs both searches back to back; an empty or failed search is
 * logged and yields no devices for that tick. Ids are "upnp:<ip>:<port>" and
 * "dlna:<ip>:<port>" taken from the LOCATION url.
 */
class SsdpWatcher {
public:
    SsdpWatcher(boost::asio::io_context& ioc,
                std::unique_ptr<ssdp::SsdpSearcher> searcher,
                DeviceRegistry& registry,
                SsdpWatcherOptions options = {});

    boost::asio::awaitable<void> Run();
    void Cancel();

    // One poll: both searches, returns the number of accepted responses.
    boost::asio::awaitable<std::size_t> Scan();

    // false when the response was skipped (bad location, host is not an IP address)
    bool HandleResponse(const ssdp::SsdpResponse& response, const DeviceType& device_type);

private:
    std::unique_ptr<ssdp::SsdpSearcher> searcher_;
    DeviceRegistry& registry_;
    SsdpWatcherOptions options_;
    boost::asio::steady_timer poll_timer_;
    bool cancelled_{false};
};

} // namespace castscout::core
