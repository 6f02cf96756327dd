#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/network/ssdp/ssdp_searcher.h>
#include <cstdint>
#include <optional>

namespace castscout::core::ssdp {

// M-SEARCH over UDP multicast. Runs one search at a time on the owning io_context.
class SsdpClient : public SsdpSearcher {
public:
    explicit SsdpClient(boost::asio::io_context& ioc,
                        boost::asio::ip::udp::endpoint multicast_endpoint = {
                            boost::asio::ip::make_address_v4("239.255.255.250"), 1900});
    SsdpClient(const SsdpClient&) = delete;
    SsdpClient& operator=(const SsdpClient&) = delete;

    boost::asio::awaitable<std::vector<SsdpResponse>> Search(std::string search_target,
                                                             std::chrono::milliseconds timeout,
                                                             int retransmissions) override;
    void Cancel() override;

private:
    void closeSocket();

    boost::asio::io_context& io_context_;
    boost::asio::ip::udp::endpoint multicast_endpoint_;
    std::optional<boost::asio::ip::udp::socket> socket_;
    boost::asio::steady_timer deadline_;
    uint64_t search_generation_{0};
    bool cancelled_{false};
};

} // namespace castscout::core::ssdp
