#include <utility>
#include <algorithm>
#include <array>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/ssdp/ssdp_client.h>
#include <set>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace castscout::core::ssdp {

SsdpClient::SsdpClient(io_context& ioc, ip::udp::endpoint multicast_endpoint)
    : io_context_(ioc)
    , multicast_endpoint_(std::move(multicast_endpoint))
    , deadline_(ioc) {}

awaitable<std::vector<SsdpResponse>> SsdpClient::Search(std::string search_target,
                                                        std::chrono::milliseconds timeout,
                                                        int retransmissions) {
    std::vector<SsdpResponse> responses;
    if (cancelled_) {
        co_return responses;
    }

    auto generation = ++search_generation_;
    socket_.emplace(io_context_);
    bool aborted = false;
    try {
        socket_->open(ip::udp::v4());
        // UPnP mandates a TTL value of 4
        socket_->set_option(ip::multicast::hops(4));
        socket_->bind(ip::udp::endpoint(ip::address_v4::any(), 0));

        auto request = BuildSearchRequest(search_target,
                                          std::chrono::duration_cast<std::chrono::seconds>(timeout));
        for (int i = 0; i < std::max(retransmissions, 1) && !cancelled_; ++i) {
            co_await socket_->async_send_to(buffer(request), multicast_endpoint_, use_awaitable);
        }
    } catch (const boost::system::system_error&) {
        closeSocket();
        if (!cancelled_) {
            throw;
        }
        // Cancel closed the socket under a pending send
        aborted = true;
    }
    if (aborted) {
        co_return responses;
    }

    deadline_.expires_after(timeout);
    deadline_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (!ec && generation == search_generation_) {
            closeSocket();
        }
    });

    std::array<char, 2048> datagram;
    ip::udp::endpoint sender;
    std::set<std::string> seen;
    while (!cancelled_ && socket_ && socket_->is_open()) {
        boost::system::error_code ec;
        std::size_t received = co_await socket_->async_receive_from(buffer(datagram),
                                                                    sender,
                                                                    redirect_error(use_awaitable,
                                                                                   ec));
        if (ec) {
            break; // deadline reached or cancelled
        }
        auto response = ParseSsdpResponse(std::string_view(datagram.data(), received));
        if (!response) {
            spdlog::debug("Ignoring non-response SSDP datagram from {}",
                          sender.address().to_string());
            continue;
        }
        if (!seen.insert(response->usn + "|" + response->location).second) {
            continue;
        }
        responses.push_back(std::move(*response));
    }

    deadline_.cancel();
    closeSocket();
    spdlog::debug("SSDP search for {} returned {} responses", search_target, responses.size());
    co_return responses;
}

void SsdpClient::Cancel() {
    cancelled_ = true;
    deadline_.cancel();
    closeSocket();
}

void SsdpClient::closeSocket() {
    if (socket_ && socket_->is_open()) {
        boost::system::error_code ec;
        socket_->close(ec);
        if (ec) {
            spdlog::warn("Failed to close SSDP socket: {}", ec.message());
        }
    }
}

} // namespace castscout::core::ssdp
