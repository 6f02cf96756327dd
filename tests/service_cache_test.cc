#include "dns_packet_builder.h"

#include <core/network/mdns/service_cache.h>
#include <chrono>
#include <gtest/gtest.h>
#include <string>

using namespace castscout::core::mdns;
using castscout::testing::DnsPacketBuilder;

namespace {

constexpr const char* kCast = "_googlecast._tcp.local.";
constexpr const char* kInstance = "Living Room._googlecast._tcp.local";

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

ServiceCache::Update apply(ServiceCache& cache,
                           const DnsPacketBuilder& builder,
                           Clock::time_point now = Clock::now()) {
    return cache.Apply(ParseMessage(builder.bytes().data(), builder.size()), now);
}

std::vector<ServiceResolved> resolvedEvents(const ServiceCache::Update& update) {
    std::vector<ServiceResolved> resolved;
    for (const auto& event : update.events) {
        if (const auto* r = std::get_if<ServiceResolved>(&event); r) {
            resolved.push_back(*r);
        }
    }
    return resolved;
}

} // namespace

TEST(ServiceCacheTest, WatchIsCaseAndDotInsensitive) {
    ServiceCache cache;
    cache.Watch(kCast);
    cache.Watch("_GoogleCast._tcp.local");
    EXPECT_EQ(cache.WatchedServices(), std::vector<std::string>{kCast});

    DnsPacketBuilder builder;
    builder.Ptr("_GOOGLECAST._TCP.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    auto resolved = resolvedEvents(apply(cache, builder));
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].info.service_type, kCast);
}

TEST(ServiceCacheTest, ResolvesCompleteAnnouncement) {
    ServiceCache cache;
    cache.Watch(kCast);

    DnsPacketBuilder builder;
    builder.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .Txt(kInstance, {"md=Chromecast", "fn=Living Room"})
        .Aaaa("livingroom.local", "fe80::1")
        .A("livingroom.local", "192.168.1.40");

    auto update = apply(cache, builder);
    EXPECT_TRUE(update.unresolved_hosts.empty());
    auto resolved = resolvedEvents(update);
    ASSERT_EQ(resolved.size(), 1u);

    const auto& info = resolved[0].info;
    EXPECT_EQ(info.service_type, kCast);
    EXPECT_EQ(info.fullname, "Living Room._googlecast._tcp.local.");
    EXPECT_EQ(info.hostname, "livingroom.local.");
    EXPECT_EQ(info.port, 8009);
    ASSERT_EQ(info.addresses.size(), 2u);
    EXPECT_EQ(info.addresses[0], boost::asio::ip::make_address("192.168.1.40"));
    EXPECT_EQ(info.properties.at("md"), "Chromecast");
}

TEST(ServiceCacheTest, IgnoresUnwatchedServices) {
    ServiceCache cache;
    cache.Watch(kCast);

    DnsPacketBuilder builder;
    builder.Ptr("_airplay._tcp.local", "TV._airplay._tcp.local")
        .Srv("TV._airplay._tcp.local", "tv.local", 7000)
        .A("tv.local", "10.0.0.9");

    auto update = apply(cache, builder);
    EXPECT_TRUE(update.events.empty());
}

TEST(ServiceCacheTest, ReportsUnresolvedHostUntilAddressArrives) {
    ServiceCache cache;
    cache.Watch(kCast);

    DnsPacketBuilder first;
    first.Ptr("_googlecast._tcp.local", kInstance).Srv(kInstance, "livingroom.local", 8009);
    auto update = apply(cache, first);
    EXPECT_TRUE(resolvedEvents(update).empty());
    EXPECT_EQ(update.unresolved_hosts, std::vector<std::string>{"livingroom.local."});

    DnsPacketBuilder second;
    second.A("livingroom.local", "192.168.1.40");
    update = apply(cache, second);
    auto resolved = resolvedEvents(update);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].info.port, 8009);
}

TEST(ServiceCacheTest, GoodbyeRemovesInstance) {
    ServiceCache cache;
    cache.Watch(kCast);

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello);

    DnsPacketBuilder goodbye;
    goodbye.Ptr("_googlecast._tcp.local", kInstance, 0);
    auto update = apply(cache, goodbye);
    ASSERT_EQ(update.events.size(), 1u);
    const auto* removed = std::get_if<ServiceRemoved>(&update.events[0]);
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->service_type, kCast);

    // the SRV owner is gone, a later address refresh reports nothing
    DnsPacketBuilder refresh;
    refresh.A("livingroom.local", "192.168.1.40");
    EXPECT_TRUE(apply(cache, refresh).events.empty());
}

TEST(ServiceCacheTest, QueriesAreIgnored) {
    ServiceCache cache;
    cache.Watch(kCast);
    DnsPacketBuilder query(0x0000);
    query.Ptr("_googlecast._tcp.local", kInstance);
    EXPECT_TRUE(apply(cache, query).events.empty());
}

TEST(ServiceCacheTest, ClearForgetsEverything) {
    ServiceCache cache;
    cache.Watch(kCast);
    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello);
    ASSERT_EQ(cache.InstanceCount(), 1u);

    cache.Clear();
    EXPECT_TRUE(cache.WatchedServices().empty());
    EXPECT_EQ(cache.InstanceCount(), 0u);
    EXPECT_EQ(cache.HostCount(), 0u);
    EXPECT_TRUE(apply(cache, hello).events.empty());
}

TEST(ServiceCacheTest, AddressesOfUnrelatedHostsAreNotKept) {
    ServiceCache cache;
    cache.Watch(kCast);

    for (int packet = 0; packet < 50; ++packet) {
        DnsPacketBuilder builder;
        for (int i = 0; i < 100; ++i) {
            int host = packet * 100 + i;
            builder.A("host" + std::to_string(host) + ".local",
                      "10.0." + std::to_string(host / 250) + "." + std::to_string(host % 250 + 1));
        }
        EXPECT_TRUE(apply(cache, builder).events.empty());
    }
    EXPECT_EQ(cache.HostCount(), 0u);
    EXPECT_EQ(cache.InstanceCount(), 0u);
}

TEST(ServiceCacheTest, InstanceExpiresAfterPtrTtl) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance, 10)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    ASSERT_EQ(resolvedEvents(apply(cache, hello, start)).size(), 1u);
    EXPECT_EQ(cache.HostCount(), 1u);

    DnsPacketBuilder empty;
    EXPECT_TRUE(apply(cache, empty, start + 9s).events.empty());
    EXPECT_EQ(cache.InstanceCount(), 1u);

    auto update = apply(cache, empty, start + 11s);
    ASSERT_EQ(update.events.size(), 1u);
    const auto* removed = std::get_if<ServiceRemoved>(&update.events[0]);
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->fullname, "Living Room._googlecast._tcp.local.");
    EXPECT_EQ(cache.InstanceCount(), 0u);
    EXPECT_EQ(cache.HostCount(), 0u);
}

TEST(ServiceCacheTest, ExpiredSrvDropsTargetAddresses) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009, 5)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello, start);

    DnsPacketBuilder late_address;
    late_address.A("livingroom.local", "192.168.1.40");
    EXPECT_TRUE(apply(cache, late_address, start + 6s).events.empty());
    EXPECT_EQ(cache.InstanceCount(), 1u);
    EXPECT_EQ(cache.HostCount(), 0u);
}

TEST(ServiceCacheTest, StoppedInstanceIsNotRevivedByHostAddresses) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance, 10)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello, start);

    // the host keeps answering address queries after the service went away
    DnsPacketBuilder address;
    address.A("livingroom.local", "192.168.1.40");
    apply(cache, address, start + 11s);
    for (int i = 1; i <= 3; ++i) {
        auto update = apply(cache, address, start + 11s + i * 1s);
        EXPECT_TRUE(update.events.empty());
        EXPECT_TRUE(update.unresolved_hosts.empty());
    }
    EXPECT_EQ(cache.HostCount(), 0u);
}

TEST(ServiceCacheTest, AddressRefreshDoesNotReportAgain) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    ASSERT_EQ(resolvedEvents(apply(cache, hello, start)).size(), 1u);

    DnsPacketBuilder refresh;
    refresh.A("livingroom.local", "192.168.1.40").Aaaa("livingroom.local", "fe80::1");
    EXPECT_TRUE(apply(cache, refresh, start + 2s).events.empty());
    EXPECT_EQ(cache.HostCount(), 1u);
}

TEST(ServiceCacheTest, CacheFlushReplacesOlderAddresses) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello, start);

    DnsPacketBuilder moved;
    moved.Srv(kInstance, "livingroom.local", 8009).A("livingroom.local", "192.168.1.41");
    auto resolved = resolvedEvents(apply(cache, moved, start + 5s));
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].info.addresses,
              std::vector<boost::asio::ip::address>{boost::asio::ip::make_address("192.168.1.41")});
}

TEST(ServiceCacheTest, SharedAddressesAccumulate) {
    ServiceCache cache;
    cache.Watch(kCast);
    auto start = Clock::now();

    DnsPacketBuilder hello;
    hello.Ptr("_googlecast._tcp.local", kInstance)
        .Srv(kInstance, "livingroom.local", 8009)
        .A("livingroom.local", "192.168.1.40");
    apply(cache, hello, start);

    DnsPacketBuilder second;
    second.Srv(kInstance, "livingroom.local", 8009).SharedRecords().A("livingroom.local", "192.168.1.41");
    auto resolved = resolvedEvents(apply(cache, second, start + 5s));
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].info.addresses.size(), 2u);
}

TEST(ServiceCacheTest, CanonicalName) {
    EXPECT_EQ(CanonicalName("LivingRoom.Local"), "livingroom.local.");
    EXPECT_EQ(CanonicalName("a."), "a.");
}
