#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/ssdp/ssdp_client.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace castscout::core {

namespace {

std::string joinNames(const std::vector<DeviceType>& types) {
    std::string joined;
    for (const auto& type : types) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += type.Name();
    }
    return joined;
}

} // namespace

void to_json(nlohmann::json& j, const DiscoveryStatus& status) {
    j = nlohmann::json{
        {"discovery_running", status.running},
        {"device_count", status.device_count},
        {"active_watchers", status.active_watchers},
        {"failed_types", status.failed_types},
    };
}

DiscoveryManager::DiscoveryManager(DiscoveryOptions options)
    : DiscoveryManager(
          options,
          [mdns_options = options.mdns](io_context& ioc) {
              return std::make_unique<mdns::MdnsDaemon>(ioc, mdns_options);
          },
          [](io_context& ioc) { return std::make_unique<ssdp::SsdpClient>(ioc); }) {}

DiscoveryManager::DiscoveryManager(DiscoveryOptions options,
                                   BrowserFactory browser_factory,
                                   SearcherFactory searcher_factory)
    : options_(options)
    , browser_factory_(std::move(browser_factory))
    , searcher_factory_(std::move(searcher_factory)) {
    spdlog::debug("discovery_manager created.");
}

DiscoveryManager::~DiscoveryManager() {
    Stop();
}

void DiscoveryManager::Start(const std::vector<DeviceType>& device_types) {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_) {
        spdlog::debug("Device discovery already running");
        return;
    }

    std::vector<DeviceType> types;
    for (const auto& type : device_types) {
        if (std::find(types.begin(), types.end(), type) == types.end()) {
            types.push_back(type);
        }
    }
    spdlog::info("Starting device discovery for: {}", joinNames(types));

    std::unique_ptr<mdns::ServiceBrowser> browser;
    try {
        browser = browser_factory_(io_context_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create mDNS daemon: {}", e.what());
        throw DiscoveryError(fmt::format("Failed to create mDNS daemon: {}", e.what()));
    }

    io_context_.restart();
    failed_types_.clear();

    for (const auto& type : types) {
        auto service_type = type.MdnsService();
        try {
            auto events = browser->Browse(service_type);
            mdns_watchers_.push_back(std::make_unique<MdnsWatcher>(type, std::move(events), registry_));
        } catch (const std::exception& e) {
            // isolated: the other protocols keep running
            spdlog::warn("Failed to browse {}: {}", service_type, e.what());
            failed_types_.push_back(type);
        }
    }

    bool needs_upnp = std::any_of(types.begin(), types.end(), [](const DeviceType& type) {
        return type.IsUpnpFamily();
    });
    if (needs_upnp) {
        try {
            ssdp_watcher_ = std::make_unique<SsdpWatcher>(io_context_,
                                                          searcher_factory_(io_context_),
                                                          registry_,
                                                          options_.ssdp);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to create SSDP searcher: {}", e.what());
        }
    }

    reaper_ = std::make_unique<StaleReaper>(io_context_,
                                            registry_,
                                            options_.stale_timeout,
                                            options_.sweep_interval);
    browser_ = std::move(browser);

    work_guard_.emplace(make_work_guard(io_context_));
    spawn("mdns-daemon", browser_->Run());
    for (auto& watcher : mdns_watchers_) {
        spawn("mdns-watcher " + watcher->device_type().Name(), watcher->Run());
    }
    if (ssdp_watcher_) {
        spawn("ssdp-watcher", ssdp_watcher_->Run());
    }
    spawn("stale-reaper", reaper_->Run());

    worker_ = std::thread([this] { runWorker(); });
    running_ = true;
    spdlog::info("Device discovery started successfully");
}

void DiscoveryManager::Stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_) {
        return;
    }

    spdlog::info("Stopping device discovery...");
    post(io_context_, [this] { cancelTasks(); });
    work_guard_.reset();
    if (worker_.joinable()) {
        worker_.join();
    }

    mdns_watchers_.clear();
    ssdp_watcher_.reset();
    reaper_.reset();
    browser_.reset();
    running_ = false;
    spdlog::info("Device discovery stopped");
}

DiscoveryStatus DiscoveryManager::Status() const {
    std::lock_guard lock(lifecycle_mutex_);
    DiscoveryStatus status;
    status.running = running_;
    status.device_count = registry_.Size();
    status.active_watchers = mdns_watchers_.size() + (ssdp_watcher_ ? 1 : 0);
    status.failed_types = failed_types_;
    return status;
}

void DiscoveryManager::SetDeviceFoundCallback(std::function<void(const DiscoveredDevice&)> callback) {
    registry_.SetDeviceFoundCallback(std::move(callback));
}

void DiscoveryManager::SetDeviceLostCallback(std::function<void(std::string_view)> callback) {
    registry_.SetDeviceLostCallback(std::move(callback));
}

void DiscoveryManager::spawn(std::string name, awaitable<void> task) {
    co_spawn(io_context_, std::move(task), [name = std::move(name)](std::exception_ptr e) {
        if (!e) {
            return;
        }
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            spdlog::error("Discovery task {} failed: {}", name, ex.what());
        }
    });
}

void DiscoveryManager::cancelTasks() {
    for (auto& watcher : mdns_watchers_) {
        watcher->Cancel();
    }
    if (ssdp_watcher_) {
        ssdp_watcher_->Cancel();
    }
    if (reaper_) {
        reaper_->Cancel();
    }
    if (browser_) {
        browser_->Shutdown();
    }
}

void DiscoveryManager::runWorker() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        spdlog::error("Discovery worker stopped unexpectedly: {}", e.what());
    }
}

} // namespace castscout::core
