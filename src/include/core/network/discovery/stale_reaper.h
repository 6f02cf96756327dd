#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/network/discovery/device_registry.h>

namespace castscout::core {

// Periodically removes devices that have not been advertised for longer than stale_timeout.
class StaleReaper {
public:
    StaleReaper(boost::asio::io_context& ioc,
                DeviceRegistry& registry,
                std::chrono::milliseconds stale_timeout = std::chrono::seconds(300),
                std::chrono::milliseconds sweep_interval = std::chrono::seconds(30));

    boost::asio::awaitable<void> Run();
    void Cancel();

    // Returns the number of devices removed.
    std::size_t Sweep(Clock::time_point now = Clock::now());

private:
    DeviceRegistry& registry_;
    std::chrono::milliseconds stale_timeout_;
    std::chrono::milliseconds sweep_interval_;
    boost::asio::steady_timer sweep_timer_;
    bool cancelled_{false};
};

} // namespace castscout::core
