#pragma once

#include <core/model/device_capabilities.h>
#include <core/model/device_type.h>

namespace castscout::core {

// Static capability profile for a device type; the default profile for custom types.
DeviceCapabilities ResolveCapabilities(const DeviceType& type);

} // namespace castscout::core
