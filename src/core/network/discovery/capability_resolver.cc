#include <core/network/discovery/capability_resolver.h>

namespace castscout::core {

DeviceCapabilities ResolveCapabilities(const DeviceType& type) {
    using Kind = DeviceType::Kind;

    DeviceCapabilities caps;
    switch (type.kind()) {
    case Kind::kChromecast:
        caps.can_mirror = true;
        caps.supported_codecs = {"h264", "vp8", "vp9", "aac", "opus"};
        caps.max_resolution = "4K";
        caps.protocols = {"cast"};
        break;
    case Kind::kFireTv:
        caps.can_mirror = true;
        caps.supported_codecs = {"h264", "h265", "aac"};
        caps.max_resolution = "4K";
        caps.protocols = {"dial", "miracast"};
        break;
    case Kind::kAirPlay:
        caps.can_mirror = true;
        caps.protocols = {"airplay"};
        break;
    case Kind::kDlna:
        caps.protocols = {"dlna"};
        break;
    case Kind::kUpnp:
        caps.protocols = {"upnp"};
        break;
    case Kind::kMiracast:
        caps.can_mirror = true;
        caps.protocols = {"miracast"};
        break;
    case Kind::kCustom:
        break;
    }
    return caps;
}

} // namespace castscout::core
