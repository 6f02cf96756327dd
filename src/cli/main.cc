#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options.hpp>
#include <core/constant/path.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <fmt/format.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace castscout;
using namespace castscout::core;
namespace net = boost::asio;
namespace po = boost::program_options;

namespace {

std::optional<std::vector<DeviceType>> parseTypes(const std::string& list) {
    std::vector<std::string> names;
    boost::split(names, list, boost::is_any_of(","), boost::token_compress_on);
    std::vector<DeviceType> types;
    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        auto type = DeviceType::FromName(name);
        if (!type) {
            std::cerr << "Unknown device type: " << name << "\n";
            return std::nullopt;
        }
        types.push_back(*type);
    }
    return types;
}

void printTable(const std::vector<DiscoveredDevice>& devices) {
    if (devices.empty()) {
        std::cout << "No devices found.\n";
        return;
    }
    std::cout << fmt::format("{:<12} {:<40} {:<40} {}\n", "TYPE", "NAME", "ADDRESS", "ID");
    for (const auto& device : devices) {
        std::cout << fmt::format("{:<12} {:<40} {:<40} {}\n",
                                 device.device_type.Name(),
                                 device.name,
                                 fmt::format("{}:{}", device.ip.to_string(), device.port),
                                 device.id);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("castscout - discover cast receivers on the local network\n\n"
                                 "Options");
    desc.add_options()("help,h", "show this help")(
        "types,t",
        po::value<std::string>(),
        "comma separated device types: chromecast, fire_tv, air_play, dlna, upnp, miracast or "
        "an mDNS service name (default: from config)")(
        "duration,d",
        po::value<int>()->default_value(10),
        "seconds to run discovery, 0 runs until interrupted")("json,j",
                                                                "print the result as JSON")(
        "log-level,l", po::value<std::string>(), "trace, debug, info, warn, error")(
        "config,c", po::value<std::string>(), "config file path");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n\n" << desc << "\n";
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    Logger logger(Logger::Level::info, path::kLogDir);
    if (vm.count("config")) {
        InitConfig(vm["config"].as<std::string>());
    } else {
        InitConfig();
    }
    logger.set_log_level(Logger::ParseLevel(
        vm.count("log-level") ? vm["log-level"].as<std::string>() : settings.log_level));

    auto types = settings.device_types;
    if (vm.count("types")) {
        auto parsed = parseTypes(vm["types"].as<std::string>());
        if (!parsed) {
            return 1;
        }
        types = std::move(*parsed);
    }
    if (types.empty()) {
        std::cerr << "No device types to discover.\n";
        return 1;
    }

    bool json_output = vm.count("json") > 0;
    DiscoveryManager manager(MakeDiscoveryOptions(settings));
    if (!json_output) {
        manager.SetDeviceFoundCallback([](const DiscoveredDevice& device) {
            std::cout << fmt::format("+ {} [{}] {}:{}\n",
                                     device.name,
                                     device.device_type.Name(),
                                     device.ip.to_string(),
                                     device.port);
        });
        manager.SetDeviceLostCallback(
            [](std::string_view device_id) { std::cout << fmt::format("- {}\n", device_id); });
    }

    try {
        manager.Start(types);
    } catch (const DiscoveryError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    net::io_context ioc;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code& ec, int) {
        if (!ec) {
            ioc.stop();
        }
    });
    net::steady_timer deadline(ioc);
    if (auto duration = vm["duration"].as<int>(); duration > 0) {
        deadline.expires_after(std::chrono::seconds(duration));
        deadline.async_wait([&ioc](const boost::system::error_code& ec) {
            if (!ec) {
                ioc.stop();
            }
        });
    }
    ioc.run();

    manager.Stop();

    auto devices = manager.GetAll();
    spdlog::default_logger()->flush();
    if (json_output) {
        nlohmann::json result{
            {"status", manager.Status()},
            {"devices", devices},
        };
        std::cout << result.dump(2) << std::endl;
    } else {
        printTable(devices);
    }

    SaveConfig();
    return 0;
}
