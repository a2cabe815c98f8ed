#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <vector>

// Lighting-control endpoint that accepts color pushes.
// set_color/set_leds return ESP_OK, ESP_FAIL for a dropped push, or
// RGBFX_ERR_SINK_DISCONNECTED once the server is gone.
class DeviceSink {
 public:
  virtual ~DeviceSink() = default;

  virtual esp_err_t connect() = 0;
  virtual void disconnect() = 0;
  virtual bool connected() const = 0;
  virtual std::vector<DeviceInfo> list_devices() const = 0;
  virtual esp_err_t set_color(const DeviceInfo& device, const Rgb8& color) = 0;

  virtual esp_err_t set_leds(const DeviceInfo& device, const std::vector<Rgb8>& colors) {
    if (colors.empty()) {
      return ESP_ERR_INVALID_ARG;
    }
    return set_color(device, colors.front());
  }
};
