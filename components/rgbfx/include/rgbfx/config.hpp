#pragma once
#include "esp_err.h"
#include "esp_log.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct AudioCaptureConfig {
  uint32_t sample_rate{44100};
  uint32_t chunk_size{1024};
  bool loopback{true};
  int device_index{-1};
  uint32_t capture_timeout_ms{100};
};

// Named effect + option string, run with RgbFxController::run_preset().
struct EffectPreset {
  std::string name{};
  std::string effect{};
  std::string options{};
};

struct RgbFxConfig {
  uint32_t schema_version{1};
  std::string log_level{"info"};
  std::string default_effect{"Static"};
  AudioCaptureConfig audio{};
  std::vector<EffectPreset> presets{};
};

void config_reset_defaults(RgbFxConfig& cfg);
// Merges data over cfg; keys not present keep their current value.
esp_err_t config_apply_json(RgbFxConfig& cfg, const char* data, size_t len);
std::string config_to_json(const RgbFxConfig& cfg);

esp_log_level_t config_log_level(const RgbFxConfig& cfg);
const EffectPreset* config_find_preset(const RgbFxConfig& cfg, const std::string& name);
