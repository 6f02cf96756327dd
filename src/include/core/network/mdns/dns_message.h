#pragma once

#include <boost/asio/ip/address.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace castscout::core::mdns {

namespace record_type {
inline constexpr uint16_t kA = 1;
inline constexpr uint16_t kPtr = 12;
inline constexpr uint16_t kTxt = 16;
inline constexpr uint16_t kAaaa = 28;
inline constexpr uint16_t kSrv = 33;
} // namespace record_type

inline constexpr uint16_t kClassIn = 1;

class DnsParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Question {
    std::string name;
    uint16_t type = record_type::kPtr;
};

struct SrvData {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    std::string target;
};

// Only the rdata member matching `type` is filled in.
struct ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = 0; // cache-flush bit masked off
    bool cache_flush = false;
    uint32_t ttl = 0;

    std::string ptr_name;
    SrvData srv;
    std::vector<std::string> txt;
    boost::asio::ip::address address;
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> records; // answer, authority and additional sections

    bool IsResponse() const { return (flags & 0x8000) != 0; }
};

std::vector<uint8_t> BuildQuery(const std::vector<Question>& questions);

// Throws DnsParseError on truncated or malformed input.
DnsMessage ParseMessage(const uint8_t* data, std::size_t size);

// "key=value" entries, a bare "key" maps to an empty value; first occurrence wins.
std::map<std::string, std::string> ParseTxtProperties(const std::vector<std::string>& entries);

} // namespace castscout::core::mdns
