#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/network/ssdp/ssdp_message.h>
#include <string>
#include <vector>

namespace castscout::core::ssdp {

class SsdpSearcher {
public:
    virtual ~SsdpSearcher() = default;

    // Collects responses until @p timeout elapses. Zero responses is a normal outcome;
    // only socket failures throw.
    virtual boost::asio::awaitable<std::vector<SsdpResponse>> Search(
        std::string search_target, std::chrono::milliseconds timeout, int retransmissions)
        = 0;

    // Aborts an in-flight search and makes later searches return immediately.
    virtual void Cancel() = 0;
};

} // namespace castscout::core::ssdp
