#pragma once

#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/model.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_error.h>
#include <core/network/discovery/mdns_watcher.h>
#include <core/network/discovery/ssdp_watcher.h>
#include <core/network/discovery/stale_reaper.h>
#include <core/network/mdns/mdns_daemon.h>
#include <core/network/mdns/service_browser.h>
#include <core/network/ssdp/ssdp_searcher.h>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace castscout::core {

struct DiscoveryOptions {
    std::chrono::milliseconds stale_timeout = std::chrono::seconds(300);
    std::chrono::milliseconds sweep_interval = std::chrono::seconds(30);
    SsdpWatcherOptions ssdp;
    mdns::MdnsOptions mdns;
};

struct DiscoveryStatus {
    bool running = false;
    std::size_t device_count = 0;
    std::size_t active_watchers = 0;
    std::vector<DeviceType> failed_types; // browse subscriptions that could not be opened
};

void to_json(nlohmann::json& j, const DiscoveryStatus& status);

/**
 * @brief Owns the discovery lifecycle: the mDNS daemon, one watcher per device type, the
 * SSDP poller and the stale reaper, all running as coroutines on a private io_context
 * driven by one worker thread.
 *
 * @details States are Stopped and Running. Start() and Stop() are idempotent and the
 * manager can be restarted. The registry outlives Stop(); devices stay queryable until
 * reaped. Read operations are valid in either state and never fail.
 *
 * @note Start() and Stop() must not be called from the found/lost callbacks, which run
 * on the worker thread.
 */
class DiscoveryManager {
public:
    using BrowserFactory
        = std::function<std::unique_ptr<mdns::ServiceBrowser>(boost::asio::io_context&)>;
    using SearcherFactory
        = std::function<std::unique_ptr<ssdp::SsdpSearcher>(boost::asio::io_context&)>;

    explicit DiscoveryManager(DiscoveryOptions options = {});
    DiscoveryManager(DiscoveryOptions options,
                     BrowserFactory browser_factory,
                     SearcherFactory searcher_factory);
    ~DiscoveryManager();
    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    // Throws DiscoveryError if the mDNS daemon cannot be created; nothing is left running.
    void Start(const std::vector<DeviceType>& device_types);
    void Stop();
    bool IsRunning() const { return running_.load(); }

    std::vector<DiscoveredDevice> GetAll() const { return registry_.GetAll(); }
    std::vector<DiscoveredDevice> GetByType(const DeviceType& type) const {
        return registry_.GetByType(type);
    }
    std::optional<DiscoveredDevice> GetByID(const std::string& id) const {
        return registry_.GetByID(id);
    }

    DiscoveryStatus Status() const;

    void SetDeviceFoundCallback(std::function<void(const DiscoveredDevice&)> callback);
    void SetDeviceLostCallback(std::function<void(std::string_view)> callback);

    DeviceRegistry& registry() { return registry_; }

private:
    void spawn(std::string name, boost::asio::awaitable<void> task);
    void cancelTasks();
    void runWorker();

    DiscoveryOptions options_;
    BrowserFactory browser_factory_;
    SearcherFactory searcher_factory_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::thread worker_;
    DeviceRegistry registry_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::unique_ptr<mdns::ServiceBrowser> browser_;
    std::vector<std::unique_ptr<MdnsWatcher>> mdns_watchers_;
    std::unique_ptr<SsdpWatcher> ssdp_watcher_;
    std::unique_ptr<StaleReaper> reaper_;
    std::vector<DeviceType> failed_types_;
};

} // namespace castscout::core
