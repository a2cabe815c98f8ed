#include "rgbfx/device_targeting.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include "esp_random.h"
#include <algorithm>

static const char* TAG = "rgbfx-targets";

esp_err_t resolve_target_devices(const DeviceSelector& selector,
                                 const std::vector<DeviceInfo>& live_devices,
                                 std::vector<DeviceInfo>& out) {
  out.clear();
  if (selector.all || selector.indices.empty()) {
    out = live_devices;
    return ESP_OK;
  }

  esp_err_t status = ESP_OK;
  std::vector<int> seen;
  seen.reserve(selector.indices.size());
  for (int index : selector.indices) {
    if (index < 0 || static_cast<size_t>(index) >= live_devices.size()) {
      ESP_LOGW(TAG, "Unknown device index %d (sink reports %u devices), skipping", index,
               static_cast<unsigned>(live_devices.size()));
      status = RGBFX_ERR_UNKNOWN_DEVICE;
      continue;
    }
    if (std::find(seen.begin(), seen.end(), index) != seen.end()) {
      continue;
    }
    seen.push_back(index);
    out.push_back(live_devices[static_cast<size_t>(index)]);
  }
  return status;
}

std::vector<DeviceInfo> pick_random_device(const std::vector<DeviceInfo>& targets) {
  if (targets.empty()) {
    return {};
  }
  return {targets[esp_random() % targets.size()]};
}
