#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace castscout::core {

struct DeviceCapabilities {
    bool can_video = true;
    bool can_audio = true;
    bool can_image = true;
    bool can_mirror = false;
    std::vector<std::string> supported_codecs{"h264", "aac"};
    std::optional<std::string> max_resolution{"1080p"};
    std::vector<std::string> protocols;

    bool operator==(const DeviceCapabilities& other) const = default;
};

inline void to_json(nlohmann::json& j, const DeviceCapabilities& caps) {
    j = nlohmann::json{
        {"can_video", caps.can_video},
        {"can_audio", caps.can_audio},
        {"can_image", caps.can_image},
        {"can_mirror", caps.can_mirror},
        {"supported_codecs", caps.supported_codecs},
        {"max_resolution",
         caps.max_resolution ? nlohmann::json(*caps.max_resolution) : nlohmann::json(nullptr)},
        {"protocols", caps.protocols},
    };
}

} // namespace castscout::core
