#include <core/constant/path.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace castscout::core {

namespace {

std::filesystem::path config_path = path::kConfigFile;

void loadSeconds(const toml::table& section, std::string_view key, std::chrono::seconds& target) {
    auto node = section[key];
    if (!node) {
        return;
    }
    auto value = node.value<int64_t>();
    if (!value || *value <= 0) {
        spdlog::warn("Ignoring invalid config value discovery.{}, keeping {}s",
                     key,
                     target.count());
        return;
    }
    target = std::chrono::seconds(*value);
}

void loadDiscovery(const toml::table& section) {
    if (auto* types = section["device-types"].as_array(); types) {
        std::vector<DeviceType> parsed;
        for (const auto& node : *types) {
            auto name = node.value<std::string>();
            auto type = name ? DeviceType::FromName(*name) : std::nullopt;
            if (!type) {
                spdlog::warn("Ignoring unknown device type in config: {}", name.value_or("<non-string>"));
                continue;
            }
            parsed.push_back(*type);
        }
        settings.device_types = std::move(parsed);
    }

    loadSeconds(section, "stale-timeout", settings.stale_timeout);
    loadSeconds(section, "sweep-interval", settings.sweep_interval);
    loadSeconds(section, "ssdp-poll-interval", settings.ssdp_poll_interval);
    loadSeconds(section, "ssdp-search-timeout", settings.ssdp_search_timeout);
    loadSeconds(section, "mdns-query-interval", settings.mdns_query_interval);

    if (auto retransmissions = section["ssdp-retransmissions"].value<int64_t>(); retransmissions) {
        if (*retransmissions >= 1 && *retransmissions <= 10) {
            settings.ssdp_retransmissions = static_cast<int>(*retransmissions);
        } else {
            spdlog::warn("Ignoring invalid config value discovery.ssdp-retransmissions");
        }
    }
}

} // namespace

void LoadSettings(const toml::table& table) {
    settings = Settings{};
    if (auto* discovery = table["discovery"].as_table(); discovery) {
        loadDiscovery(*discovery);
    }
    if (auto* log = table["log"].as_table(); log) {
        settings.log_level = (*log)["level"].value_or(settings.log_level);
    }
}

void InitConfig(const std::filesystem::path& path) {
    config_path = path;
    if (auto dir = path.parent_path(); !dir.empty() && !std::filesystem::exists(dir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(dir);
    }
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSettings(config);
}

void InitConfig() {
    InitConfig(path::kConfigFile);
}

void SaveConfig(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }

    toml::array types;
    for (const auto& type : settings.device_types) {
        types.push_back(type.kind() == DeviceType::Kind::kCustom ? type.custom_service()
                                                                 : type.Name());
    }
    config.insert_or_assign("discovery",
                            toml::table{
                                {"device-types", std::move(types)},
                                {"stale-timeout", settings.stale_timeout.count()},
                                {"sweep-interval", settings.sweep_interval.count()},
                                {"ssdp-poll-interval", settings.ssdp_poll_interval.count()},
                                {"ssdp-search-timeout", settings.ssdp_search_timeout.count()},
                                {"ssdp-retransmissions", settings.ssdp_retransmissions},
                                {"mdns-query-interval", settings.mdns_query_interval.count()},
                            });
    config.insert_or_assign("log", toml::table{{"level", settings.log_level}});
    ofs << config;
}

void SaveConfig() {
    SaveConfig(config_path);
}

DiscoveryOptions MakeDiscoveryOptions(const Settings& settings) {
    DiscoveryOptions options;
    options.stale_timeout = settings.stale_timeout;
    options.sweep_interval = settings.sweep_interval;
    options.ssdp.poll_interval = settings.ssdp_poll_interval;
    options.ssdp.search_timeout = settings.ssdp_search_timeout;
    options.ssdp.retransmissions = settings.ssdp_retransmissions;
    options.mdns.query_interval = settings.mdns_query_interval;
    return options;
}

} // namespace castscout::core
