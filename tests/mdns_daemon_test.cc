#include "dns_packet_builder.h"

#include <utility>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <core/network/mdns/mdns_daemon.h>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>

using namespace castscout::core::mdns;
using castscout::testing::DnsPacketBuilder;
using boost::asio::awaitable;
using boost::asio::ip::udp;
using namespace std::chrono_literals;

namespace {

constexpr const char* kInstance = "Living Room._googlecast._tcp.local";

// Runs an MdnsDaemon against a unicast responder on the loopback interface.
class MdnsDaemonTest : public ::testing::Test {
protected:
    MdnsDaemonTest() {
        responder_.open(udp::v4());
        responder_.bind(udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));

        MdnsOptions options;
        options.group = boost::asio::ip::address_v4::loopback();
        options.port = responder_.local_endpoint().port();
        options.listen_port = 0;
        options.query_interval = 1h;
        daemon_ = std::make_unique<MdnsDaemon>(ioc_, options);
    }

    void run(awaitable<void> scenario) {
        boost::asio::co_spawn(ioc_, daemon_->Run(), boost::asio::detached);
        auto done = boost::asio::co_spawn(ioc_, finish(std::move(scenario)), boost::asio::use_future);
        guard_.expires_after(5s);
        guard_.async_wait([this](const boost::system::error_code& ec) {
            if (!ec) {
                tearDownNetwork();
                ioc_.stop();
            }
        });
        ioc_.run();
        ASSERT_EQ(done.wait_for(0s), std::future_status::ready) << "scenario timed out";
        done.get();
    }

    awaitable<DnsMessage> receiveQuery() {
        std::array<uint8_t, 1500> datagram;
        auto size = co_await responder_.async_receive_from(boost::asio::buffer(datagram),
                                                           daemon_endpoint_,
                                                           boost::asio::use_awaitable);
        co_return ParseMessage(datagram.data(), size);
    }

    awaitable<void> reply(std::vector<uint8_t> packet) {
        co_await responder_.async_send_to(boost::asio::buffer(packet),
                                          daemon_endpoint_,
                                          boost::asio::use_awaitable);
    }

    static bool isResolved(const std::optional<ServiceEvent>& event) {
        return event && std::holds_alternative<ServiceResolved>(*event);
    }

    boost::asio::io_context ioc_;
    udp::socket responder_{ioc_};
    udp::endpoint daemon_endpoint_;
    std::unique_ptr<MdnsDaemon> daemon_;
    boost::asio::steady_timer guard_{ioc_};

private:
    awaitable<void> finish(awaitable<void> scenario) {
        try {
            co_await std::move(scenario);
        } catch (const std::exception&) {
            tearDownNetwork();
            throw;
        }
        tearDownNetwork();
    }

    void tearDownNetwork() {
        guard_.cancel();
        daemon_->Shutdown();
        boost::system::error_code ec;
        responder_.close(ec);
    }
};

} // namespace

TEST_F(MdnsDaemonTest, QueriesHostAddressThenResolves) {
    run([this]() -> awaitable<void> {
        auto channel = daemon_->Browse("_GoogleCast._tcp.local");
        auto started = co_await channel->Receive();
        EXPECT_TRUE(started && std::holds_alternative<SearchStarted>(*started));

        auto query = co_await receiveQuery();
        EXPECT_FALSE(query.IsResponse());
        if (query.questions.size() != 1u) {
            ADD_FAILURE() << "expected one PTR question";
            co_return;
        }
        EXPECT_EQ(query.questions[0].type, record_type::kPtr);
        EXPECT_EQ(CanonicalName(query.questions[0].name), "_googlecast._tcp.local.");

        DnsPacketBuilder announcement;
        announcement.Ptr("_googlecast._tcp.local", kInstance)
            .Srv(kInstance, "livingroom.local", 8009)
            .Txt(kInstance, {"md=Chromecast"});
        co_await reply(announcement.bytes());

        // SRV target without an address: the daemon asks for its A record
        auto address_query = co_await receiveQuery();
        if (address_query.questions.size() != 1u) {
            ADD_FAILURE() << "expected one A question";
            co_return;
        }
        EXPECT_EQ(address_query.questions[0].type, record_type::kA);
        EXPECT_EQ(CanonicalName(address_query.questions[0].name), "livingroom.local.");

        DnsPacketBuilder address;
        address.A("livingroom.local", "192.168.1.40");
        co_await reply(address.bytes());

        auto event = co_await channel->Receive();
        if (!isResolved(event)) {
            ADD_FAILURE() << "expected a resolved service";
            co_return;
        }
        const auto& info = std::get<ServiceResolved>(*event).info;
        EXPECT_EQ(info.service_type, "_GoogleCast._tcp.local");
        EXPECT_EQ(info.port, 8009);
        EXPECT_EQ(info.addresses,
                  std::vector<boost::asio::ip::address>{boost::asio::ip::make_address("192.168.1.40")});
    }());
}

TEST_F(MdnsDaemonTest, RoutesEventsToTheirServiceChannel) {
    run([this]() -> awaitable<void> {
        auto cast = daemon_->Browse("_googlecast._tcp.local.");
        auto airplay = daemon_->Browse("_airplay._tcp.local.");
        EXPECT_EQ(daemon_->Browse("_GOOGLECAST._tcp.local"), cast);
        co_await cast->Receive();
        co_await airplay->Receive();
        co_await receiveQuery();
        co_await receiveQuery();

        DnsPacketBuilder tv;
        tv.Ptr("_airplay._tcp.local", "TV._airplay._tcp.local")
            .Srv("TV._airplay._tcp.local", "tv.local", 7000)
            .A("tv.local", "10.0.0.9");
        co_await reply(tv.bytes());

        DnsPacketBuilder living_room;
        living_room.Ptr("_googlecast._tcp.local", kInstance)
            .Srv(kInstance, "livingroom.local", 8009)
            .A("livingroom.local", "192.168.1.40");
        co_await reply(living_room.bytes());

        auto airplay_event = co_await airplay->Receive();
        auto cast_event = co_await cast->Receive();
        if (!isResolved(airplay_event) || !isResolved(cast_event)) {
            ADD_FAILURE() << "expected one resolved service per channel";
            co_return;
        }
        EXPECT_EQ(std::get<ServiceResolved>(*airplay_event).info.port, 7000);
        EXPECT_EQ(std::get<ServiceResolved>(*cast_event).info.port, 8009);
    }());
}

TEST_F(MdnsDaemonTest, MalformedPacketsAreDropped) {
    run([this]() -> awaitable<void> {
        auto channel = daemon_->Browse("_googlecast._tcp.local.");
        co_await channel->Receive();
        co_await receiveQuery();

        std::vector<uint8_t> header_only{0x00, 0x00, 0x84};
        co_await reply(header_only);
        std::vector<uint8_t> counts_only{0, 0, 0x84, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        co_await reply(counts_only);

        DnsPacketBuilder living_room;
        living_room.Ptr("_googlecast._tcp.local", kInstance)
            .Srv(kInstance, "livingroom.local", 8009)
            .A("livingroom.local", "192.168.1.40");
        co_await reply(living_room.bytes());

        auto event = co_await channel->Receive();
        EXPECT_TRUE(isResolved(event));
    }());
}

TEST_F(MdnsDaemonTest, ShutdownClosesEveryChannel) {
    run([this]() -> awaitable<void> {
        auto cast = daemon_->Browse("_googlecast._tcp.local.");
        auto airplay = daemon_->Browse("_airplay._tcp.local.");
        co_await cast->Receive();
        co_await airplay->Receive();

        daemon_->Shutdown();
        EXPECT_TRUE(cast->IsClosed());
        EXPECT_TRUE(airplay->IsClosed());
        auto cast_event = co_await cast->Receive();
        auto airplay_event = co_await airplay->Receive();
        EXPECT_FALSE(cast_event.has_value());
        EXPECT_FALSE(airplay_event.has_value());
        daemon_->Shutdown();
    }());
}
