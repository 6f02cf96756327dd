#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/discovery/stale_reaper.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace castscout::core {

StaleReaper::StaleReaper(io_context& ioc,
                         DeviceRegistry& registry,
                         std::chrono::milliseconds stale_timeout,
                         std::chrono::milliseconds sweep_interval)
    : registry_(registry)
    , stale_timeout_(stale_timeout)
    , sweep_interval_(sweep_interval)
    , sweep_timer_(ioc) {}

awaitable<void> StaleReaper::Run() {
    while (!cancelled_) {
        sweep_timer_.expires_after(sweep_interval_);
        boost::system::error_code ec;
        co_await sweep_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec || cancelled_) {
            break;
        }
        Sweep();
    }
    spdlog::debug("Stale reaper finished");
}

void StaleReaper::Cancel() {
    cancelled_ = true;
    sweep_timer_.cancel();
}

std::size_t StaleReaper::Sweep(Clock::time_point now) {
    std::size_t removed = 0;
    for (const auto& device : registry_.GetAll()) {
        if (!device.IsStale(stale_timeout_, now)) {
            continue;
        }
        // re-checked under the registry lock in case a watcher refreshed it meanwhile
        bool removed_now = registry_.RemoveIf(device.id, [&](const DiscoveredDevice& current) {
            return current.IsStale(stale_timeout_, now);
        });
        if (removed_now) {
            spdlog::info("Removed stale device: {} ({})", device.name, device.id);
            ++removed;
        }
    }
    return removed;
}

} // namespace castscout::core
