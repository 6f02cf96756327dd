#pragma once

#include <stdexcept>

namespace castscout::core {

// Start() could not bring up the shared listening subsystem.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace castscout::core
