#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <core/network/mdns/service_event.h>
#include <memory>
#include <string>

namespace castscout::core::mdns {

/**
 * @brief The advertisement-listening subsystem shared by all mDNS watchers.
 *
 * @details Owned exclusively by DiscoveryManager: created in Start(), shut down in Stop().
 * All methods except construction are called on the discovery io_context thread or
 * before that thread starts.
 */
class ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    // Opens a browse subscription; throws on failure.
    virtual std::shared_ptr<ServiceEventChannel> Browse(const std::string& service_type) = 0;

    // Socket loop, runs until Shutdown().
    virtual boost::asio::awaitable<void> Run() = 0;

    // Closes the socket and every channel handed out by Browse().
    virtual void Shutdown() = 0;
};

} // namespace castscout::core::mdns
