#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/network/mdns/dns_message.h>
#include <core/network/mdns/service_browser.h>
#include <core/network/mdns/service_cache.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace castscout::core::mdns {

struct MdnsOptions {
    boost::asio::ip::address_v4 group = boost::asio::ip::make_address_v4("224.0.0.251");
    uint16_t port = 5353;        // destination port of queries
    uint16_t listen_port = 5353; // 0 binds an ephemeral port
    std::chrono::milliseconds query_interval = std::chrono::seconds(60);
};

/**
 * @brief Multicast DNS querier: one socket on the mDNS group shared by every browse.
 *
 * @details Sends PTR queries for each browsed service type, re-queries them periodically
 * and routes the events produced by its ServiceCache to the channel of the matching
 * service type. Hosts that resolve without an address are queried for their A record.
 */
class MdnsDaemon : public ServiceBrowser {
public:
    // Opens and joins the multicast socket; throws boost::system::system_error on failure.
    MdnsDaemon(boost::asio::io_context& ioc, MdnsOptions options = {});
    ~MdnsDaemon() override;
    MdnsDaemon(const MdnsDaemon&) = delete;
    MdnsDaemon& operator=(const MdnsDaemon&) = delete;

    std::shared_ptr<ServiceEventChannel> Browse(const std::string& service_type) override;
    boost::asio::awaitable<void> Run() override;
    void Shutdown() override;

private:
    boost::asio::awaitable<void> queryLoop();
    void handleMessage(const DnsMessage& message);
    void sendQuery(const std::vector<Question>& questions);
    void publish(ServiceEvent event);

    boost::asio::io_context& io_context_;
    MdnsOptions options_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint group_endpoint_;
    boost::asio::steady_timer query_timer_;
    bool stopping_{false};

    ServiceCache cache_;
    std::map<std::string, std::shared_ptr<ServiceEventChannel>> channels_; // by CanonicalName
};

} // namespace castscout::core::mdns
