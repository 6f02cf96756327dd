#include <utility>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/mdns/mdns_daemon.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>

using namespace boost::asio;

namespace castscout::core::mdns {

namespace {

using reuse_port = detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

std::string_view serviceTypeOf(const ServiceEvent& event) {
    if (const auto* resolved = std::get_if<ServiceResolved>(&event); resolved) {
        return resolved->info.service_type;
    }
    if (const auto* removed = std::get_if<ServiceRemoved>(&event); removed) {
        return removed->service_type;
    }
    return std::get<SearchStarted>(event).service_type;
}

} // namespace

MdnsDaemon::MdnsDaemon(io_context& ioc, MdnsOptions options)
    : io_context_(ioc)
    , options_(options)
    , socket_(ioc)
    , group_endpoint_(options.group, options.port)
    , query_timer_(ioc) {
    socket_.open(ip::udp::v4());
    socket_.set_option(socket_base::reuse_address(true));
    socket_.set_option(reuse_port(true));
    socket_.bind(ip::udp::endpoint(ip::address_v4::any(), options_.listen_port));
    if (options_.group.is_multicast()) {
        socket_.set_option(ip::multicast::join_group(options_.group));
        socket_.set_option(ip::multicast::enable_loopback(true));
        socket_.set_option(ip::multicast::hops(255));
    }
    spdlog::info("mDNS daemon on port {} querying {}:{}",
                 socket_.local_endpoint().port(),
                 options_.group.to_string(),
                 options_.port);
}

MdnsDaemon::~MdnsDaemon() {
    Shutdown();
}

std::shared_ptr<ServiceEventChannel> MdnsDaemon::Browse(const std::string& service_type) {
    auto key = CanonicalName(service_type);
    if (auto it = channels_.find(key); it != channels_.end()) {
        return it->second;
    }

    sendQuery({Question{service_type, record_type::kPtr}});

    auto channel = std::make_shared<ServiceEventChannel>(io_context_);
    channels_.emplace(key, channel);
    cache_.Watch(service_type);
    channel->Push(SearchStarted{service_type});
    spdlog::info("Browsing for {}", service_type);
    return channel;
}

awaitable<void> MdnsDaemon::Run() {
    co_spawn(io_context_, queryLoop(), [](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("mDNS query loop failed: {}", ex.what());
            }
        }
    });

    std::array<uint8_t, 9000> buffer;
    ip::udp::endpoint sender;
    while (!stopping_ && socket_.is_open()) {
        boost::system::error_code ec;
        std::size_t received = co_await socket_.async_receive_from(boost::asio::buffer(buffer),
                                                                   sender,
                                                                   redirect_error(use_awaitable,
                                                                                  ec));
        if (ec) {
            if (ec == error::operation_aborted || stopping_) {
                break;
            }
            spdlog::warn("mDNS receive failed: {}", ec.message());
            continue;
        }
        try {
            handleMessage(ParseMessage(buffer.data(), received));
        } catch (const DnsParseError& e) {
            spdlog::debug("Dropping malformed mDNS packet from {}: {}",
                          sender.address().to_string(),
                          e.what());
        }
    }
    spdlog::debug("mDNS receive loop finished");
}

void MdnsDaemon::Shutdown() {
    if (stopping_) {
        return;
    }
    stopping_ = true;
    query_timer_.cancel();
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close mDNS socket: {}", ec.message());
    }
    for (auto& [_, channel] : channels_) {
        channel->Close();
    }
    channels_.clear();
    cache_.Clear();
    spdlog::info("mDNS daemon shut down");
}

void MdnsDaemon::handleMessage(const DnsMessage& message) {
    if (stopping_) {
        return;
    }
    auto update = cache_.Apply(message);
    spdlog::trace("mDNS cache holds {} instances, {} hosts", cache_.InstanceCount(), cache_.HostCount());
    for (auto& event : update.events) {
        publish(std::move(event));
    }
    if (update.unresolved_hosts.empty()) {
        return;
    }
    std::vector<Question> questions;
    for (const auto& host : update.unresolved_hosts) {
        questions.push_back(Question{host, record_type::kA});
    }
    try {
        sendQuery(questions);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to query host addresses: {}", e.what());
    }
}

awaitable<void> MdnsDaemon::queryLoop() {
    while (!stopping_) {
        query_timer_.expires_after(options_.query_interval);
        boost::system::error_code ec;
        co_await query_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec || stopping_) {
            break;
        }
        std::vector<Question> questions;
        for (const auto& service_type : cache_.WatchedServices()) {
            questions.push_back(Question{service_type, record_type::kPtr});
        }
        if (questions.empty()) {
            continue;
        }
        try {
            sendQuery(questions);
        } catch (const std::exception& e) {
            spdlog::warn("mDNS re-query failed: {}", e.what());
        }
    }
}

void MdnsDaemon::sendQuery(const std::vector<Question>& questions) {
    auto packet = BuildQuery(questions);
    socket_.send_to(buffer(packet), group_endpoint_);
}

void MdnsDaemon::publish(ServiceEvent event) {
    auto it = channels_.find(CanonicalName(serviceTypeOf(event)));
    if (it != channels_.end()) {
        it->second->Push(std::move(event));
    }
}

} // namespace castscout::core::mdns
