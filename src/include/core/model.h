#pragma once

#include <core/model/device_capabilities.h>
#include <core/model/device_type.h>
#include <core/model/discovered_device.h>
