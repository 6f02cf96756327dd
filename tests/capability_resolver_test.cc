#include <core/network/discovery/capability_resolver.h>
#include <gtest/gtest.h>

using namespace castscout::core;
using Kind = DeviceType::Kind;

TEST(CapabilityResolverTest, ChromecastProfile) {
    auto caps = ResolveCapabilities(Kind::kChromecast);
    EXPECT_TRUE(caps.can_video);
    EXPECT_TRUE(caps.can_audio);
    EXPECT_TRUE(caps.can_image);
    EXPECT_TRUE(caps.can_mirror);
    EXPECT_EQ(caps.supported_codecs,
              (std::vector<std::string>{"h264", "vp8", "vp9", "aac", "opus"}));
    EXPECT_EQ(caps.max_resolution, "4K");
    EXPECT_EQ(caps.protocols, std::vector<std::string>{"cast"});
}

TEST(CapabilityResolverTest, FireTvAndAirPlayProfiles) {
    auto fire_tv = ResolveCapabilities(Kind::kFireTv);
    EXPECT_TRUE(fire_tv.can_mirror);
    EXPECT_EQ(fire_tv.supported_codecs, (std::vector<std::string>{"h264", "h265", "aac"}));
    EXPECT_EQ(fire_tv.protocols, (std::vector<std::string>{"dial", "miracast"}));

    auto airplay = ResolveCapabilities(Kind::kAirPlay);
    EXPECT_TRUE(airplay.can_mirror);
    EXPECT_EQ(airplay.max_resolution, "1080p");
    EXPECT_EQ(airplay.protocols, std::vector<std::string>{"airplay"});
}

TEST(CapabilityResolverTest, CustomTypesGetTheDefaultProfile) {
    DeviceCapabilities defaults;
    EXPECT_FALSE(defaults.can_mirror);
    EXPECT_EQ(defaults.supported_codecs, (std::vector<std::string>{"h264", "aac"}));
    EXPECT_EQ(defaults.max_resolution, "1080p");
    EXPECT_TRUE(defaults.protocols.empty());

    EXPECT_EQ(ResolveCapabilities(DeviceType::Custom("_roku._tcp.local.")), defaults);
}

TEST(CapabilityResolverTest, UpnpFamilyKeepsDefaultsWithProtocolTag) {
    auto dlna = ResolveCapabilities(Kind::kDlna);
    EXPECT_FALSE(dlna.can_mirror);
    EXPECT_EQ(dlna.protocols, std::vector<std::string>{"dlna"});
    EXPECT_EQ(ResolveCapabilities(Kind::kUpnp).protocols, std::vector<std::string>{"upnp"});
}

TEST(CapabilityResolverTest, IsDeterministic) {
    for (const auto& type : DeviceType::BuiltIn()) {
        EXPECT_EQ(ResolveCapabilities(type), ResolveCapabilities(type)) << type.Name();
    }
}
