#include <algorithm>
#include <array>
#include <core/model/device_type.h>
#include <utility>

namespace castscout::core {

namespace {

struct KindEntry {
    DeviceType::Kind kind;
    std::string_view service;
    std::string_view name;
};

constexpr std::array<KindEntry, 6> kKindTable = {{
    {DeviceType::Kind::kChromecast, "_googlecast._tcp.local.", "chromecast"},
    {DeviceType::Kind::kFireTv, "_dial._tcp.local.", "fire_tv"},
    {DeviceType::Kind::kAirPlay, "_airplay._tcp.local.", "air_play"},
    {DeviceType::Kind::kDlna, "_dlna._tcp.local.", "dlna"},
    {DeviceType::Kind::kUpnp, "_upnp._tcp.local.", "upnp"},
    {DeviceType::Kind::kMiracast, "_miracast._tcp.local.", "miracast"},
}};

const KindEntry* findKind(DeviceType::Kind kind) {
    auto it = std::find_if(kKindTable.begin(), kKindTable.end(), [kind](const KindEntry& entry) {
        return entry.kind == kind;
    });
    return it == kKindTable.end() ? nullptr : &*it;
}

bool looksLikeServiceType(std::string_view name) {
    return name.size() > 1 && name.front() == '_'
           && (name.find("._tcp") != std::string_view::npos
               || name.find("._udp") != std::string_view::npos);
}

} // namespace

DeviceType DeviceType::Custom(std::string service_type) {
    DeviceType type(Kind::kCustom);
    type.custom_service_ = std::move(service_type);
    return type;
}

DeviceType DeviceType::FromServiceType(std::string_view service_type) {
    for (const auto& entry : kKindTable) {
        if (entry.service == service_type) {
            return DeviceType(entry.kind);
        }
    }
    return Custom(std::string(service_type));
}

std::optional<DeviceType> DeviceType::FromName(std::string_view name) {
    for (const auto& entry : kKindTable) {
        if (entry.name == name) {
            return DeviceType(entry.kind);
        }
    }
    if (looksLikeServiceType(name)) {
        return FromServiceType(name);
    }
    return std::nullopt;
}

const std::vector<DeviceType>& DeviceType::BuiltIn() {
    static const std::vector<DeviceType> built_in = [] {
        std::vector<DeviceType> types;
        for (const auto& entry : kKindTable) {
            types.emplace_back(entry.kind);
        }
        return types;
    }();
    return built_in;
}

std::string DeviceType::MdnsService() const {
    if (auto* entry = findKind(kind_); entry) {
        return std::string(entry->service);
    }
    return custom_service_;
}

std::string DeviceType::Name() const {
    if (auto* entry = findKind(kind_); entry) {
        return std::string(entry->name);
    }
    return "custom:" + custom_service_;
}

void to_json(nlohmann::json& j, const DeviceType& type) {
    if (type.kind() == DeviceType::Kind::kCustom) {
        j = nlohmann::json{{"custom", type.custom_service()}};
    } else {
        j = type.Name();
    }
}

} // namespace castscout::core
