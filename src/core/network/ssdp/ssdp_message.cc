#include <algorithm>
#include <cctype>
#include <charconv>
#include <core/network/ssdp/ssdp_message.h>
#include <fmt/format.h>

namespace castscout::core::ssdp {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string toUpper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

std::string BuildSearchRequest(std::string_view search_target, std::chrono::seconds mx) {
    return fmt::format("M-SEARCH * HTTP/1.1\r\n"
                       "HOST: 239.255.255.250:1900\r\n"
                       "MAN: \"ssdp:discover\"\r\n"
                       "MX: {}\r\n"
                       "ST: {}\r\n"
                       "\r\n",
                       std::clamp<long long>(mx.count(), 1, 5),
                       search_target);
}

std::optional<SsdpResponse> ParseSsdpResponse(std::string_view datagram) {
    auto line_end = datagram.find("\r\n");
    if (line_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto status_line = trim(datagram.substr(0, line_end));
    if (status_line.substr(0, 5) != "HTTP/" || status_line.find(" 200") == std::string_view::npos) {
        return std::nullopt;
    }

    SsdpResponse response;
    auto rest = datagram.substr(line_end + 2);
    while (!rest.empty()) {
        auto end = rest.find("\r\n");
        auto line = rest.substr(0, end);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto name = toUpper(trim(line.substr(0, colon)));
        std::string value(trim(line.substr(colon + 1)));
        if (name == "LOCATION") {
            response.location = std::move(value);
        } else if (name == "SERVER") {
            response.server = std::move(value);
        } else if (name == "ST") {
            response.search_target = std::move(value);
        } else if (name == "USN") {
            response.usn = std::move(value);
        }
    }

    if (response.location.empty()) {
        return std::nullopt;
    }
    return response;
}

std::optional<Location> ParseLocation(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }
    Location location;
    location.scheme = toLower(url.substr(0, scheme_end));
    if (location.scheme != "http" && location.scheme != "https") {
        return std::nullopt;
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    location.path = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        location.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port_text = after.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        location.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
        }
    }
    if (location.host.empty()) {
        return std::nullopt;
    }

    if (port_text.empty()) {
        location.port = location.scheme == "https" ? 443 : 80;
    } else {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || value == 0
            || value > 65535) {
            return std::nullopt;
        }
        location.port = static_cast<uint16_t>(value);
    }
    return location;
}

} // namespace castscout::core::ssdp
