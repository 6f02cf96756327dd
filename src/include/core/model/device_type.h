#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace castscout::core {

/**
 * @brief Classification of a cast receiver, tied to the mDNS service it advertises under.
 *
 * @details Six built-in kinds plus kCustom, which carries the raw service name of an
 * advertisement that matched no built-in kind. Every value maps to exactly one mDNS
 * service name and back.
 */
class DeviceType {
public:
    enum class Kind {
        kChromecast,
        kFireTv,
        kAirPlay,
        kDlna,
        kUpnp,
        kMiracast,
        kCustom,
    };

    DeviceType(Kind kind)
        : kind_(kind) {}

    static DeviceType Custom(std::string service_type);

    // "_googlecast._tcp.local." -> kChromecast, anything unknown -> kCustom
    static DeviceType FromServiceType(std::string_view service_type);

    // Parses the snake_case names used by config files and the command line.
    static std::optional<DeviceType> FromName(std::string_view name);

    static const std::vector<DeviceType>& BuiltIn();

    Kind kind() const { return kind_; }
    const std::string& custom_service() const { return custom_service_; }

    std::string MdnsService() const;
    std::string Name() const;

    // Types that are also reachable through SSDP searches.
    bool IsUpnpFamily() const { return kind_ == Kind::kDlna || kind_ == Kind::kUpnp; }

    bool operator==(const DeviceType& other) const = default;

private:
    Kind kind_;
    std::string custom_service_;
};

void to_json(nlohmann::json& j, const DeviceType& type);

} // namespace castscout::core
