#pragma once

#include <cstdlib>
#include <filesystem>

namespace castscout::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
    if (const char* home = std::getenv("HOME"); home != nullptr) {
        return home;
    }
    return std::filesystem::temp_directory_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "castscout"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "castscout";
#else
    kHomeDir / ".config" / "castscout";
#endif

inline const std::filesystem::path kConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace castscout::core
