#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// Producer of mono amplitude samples in [-1, 1] (microphone or loopback).
class AudioCaptureSource {
 public:
  virtual ~AudioCaptureSource() = default;

  // device_index < 0 selects the default (or first loopback) device.
  virtual esp_err_t open(uint32_t sample_rate, int device_index, bool loopback) = 0;
  // ESP_ERR_TIMEOUT when no new frame arrived within timeout_ms.
  virtual esp_err_t read_frame(size_t sample_count, std::vector<float>& out, uint32_t timeout_ms) = 0;
  virtual void close() = 0;
};

class ScreenCaptureSource {
 public:
  virtual ~ScreenCaptureSource() = default;

  // ESP_ERR_TIMEOUT when no frame is available within timeout_ms.
  virtual esp_err_t capture_frame(ScreenFrame& out, uint32_t timeout_ms) = 0;
};
