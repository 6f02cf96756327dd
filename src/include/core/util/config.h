/*
    config.h
    Discovery configuration backed by a TOML file.

    Example config.toml:

        [discovery]
        device-types = ["chromecast", "air_play", "dlna"]
        stale-timeout = 300          # seconds without advertisement before removal
        sweep-interval = 30          # seconds between stale sweeps
        ssdp-poll-interval = 60
        ssdp-search-timeout = 5
        ssdp-retransmissions = 2
        mdns-query-interval = 60

        [log]
        level = "info"

    Usage:
    - castscout::core::InitConfig();                 // loads or creates the default file
    - castscout::core::settings.stale_timeout = 120s;
    - castscout::core::SaveConfig();
    - auto options = castscout::core::MakeDiscoveryOptions(castscout::core::settings);
*/

#pragma once

#include <chrono>
#include <core/model/device_type.h>
#include <core/network/discovery/discovery_manager.h>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <vector>

namespace castscout::core {

inline toml::table config;

struct Settings {
    std::vector<DeviceType> device_types = DeviceType::BuiltIn();
    std::chrono::seconds stale_timeout{300};
    std::chrono::seconds sweep_interval{30};
    std::chrono::seconds ssdp_poll_interval{60};
    std::chrono::seconds ssdp_search_timeout{5};
    int ssdp_retransmissions = 2;
    std::chrono::seconds mdns_query_interval{60};
    std::string log_level = "info";
};

inline Settings settings;

void InitConfig(const std::filesystem::path& path);
void InitConfig();

// Applies the [discovery] and [log] sections of an already parsed table to `settings`.
void LoadSettings(const toml::table& table);

void SaveConfig(const std::filesystem::path& path);
void SaveConfig();

DiscoveryOptions MakeDiscoveryOptions(const Settings& settings);

} // namespace castscout::core
