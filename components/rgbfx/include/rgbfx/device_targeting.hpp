#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <vector>

// Resolve a selector against the devices the sink reported. Out-of-range
// indices are dropped (one warning each) and RGBFX_ERR_UNKNOWN_DEVICE is
// returned with out still holding every valid device; callers keep running.
esp_err_t resolve_target_devices(const DeviceSelector& selector,
                                 const std::vector<DeviceInfo>& live_devices,
                                 std::vector<DeviceInfo>& out);

// One device picked at random, empty when targets is empty.
std::vector<DeviceInfo> pick_random_device(const std::vector<DeviceInfo>& targets);
