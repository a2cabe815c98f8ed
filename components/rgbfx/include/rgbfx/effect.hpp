#pragma once
#include "rgbfx/capture_source.hpp"
#include "rgbfx/device_sink.hpp"
#include "rgbfx/effect_options.hpp"
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <atomic>
#include <cstdint>
#include <vector>

struct CaptureSources {
  AudioCaptureSource* audio{nullptr};
  ScreenCaptureSource* screen{nullptr};
};

// Everything an effect hook may touch during one run. Owned by EffectLifecycle;
// hooks only ever run on the lifecycle's thread, so pushes have a single writer.
class EffectContext {
 public:
  EffectContext(DeviceSink& sink, const EffectOptions& options, const CaptureSources& captures);

  const EffectOptions& options() const { return options_; }

  // Current push targets; all_targets() is the selection resolved at start.
  const std::vector<DeviceInfo>& targets() const { return targets_; }
  const std::vector<DeviceInfo>& all_targets() const { return all_targets_; }
  void reselect_random_target();
  void use_all_targets();

  // Pushes visit every device and return RGBFX_ERR_SINK_DISCONNECTED if any reported it,
  // ESP_FAIL if any device dropped a push, ESP_OK otherwise.
  esp_err_t set_targets_color(const Rgb8& color);      // scaled by max_brightness
  esp_err_t set_targets_color_raw(const Rgb8& color);  // pushed as given
  esp_err_t set_device_color(const DeviceInfo& device, const Rgb8& color);
  esp_err_t push_per_device(const std::vector<Rgb8>& colors);  // colors[i] -> targets()[i]
  esp_err_t turn_off_targets();                                // black to all_targets()

  // Overrides sleep_s for the wait that follows the current iteration.
  void set_next_delay_ms(uint32_t delay_ms);
  // Bounded completion: the lifecycle stops after this iteration.
  void finish() { finished_ = true; }
  // True once request_stop() was called, from any thread.
  bool stop_requested() const { return stop_flag_ && stop_flag_->load(); }

  // Scheduled timeline: sum of the waits completed so far.
  float elapsed_s() const { return static_cast<float>(elapsed_us_) / 1000000.0f; }
  int64_t now_us() const;

  AudioCaptureSource* audio_source() const { return captures_.audio; }
  ScreenCaptureSource* screen_source() const { return captures_.screen; }

 private:
  friend class EffectLifecycle;

  esp_err_t push(const std::vector<DeviceInfo>& devices, const Rgb8& color);

  DeviceSink& sink_;
  const EffectOptions& options_;
  CaptureSources captures_;
  const std::atomic<bool>* stop_flag_{nullptr};
  std::vector<DeviceInfo> all_targets_{};
  std::vector<DeviceInfo> targets_{};
  int64_t next_delay_ms_{-1};
  int64_t elapsed_us_{0};
  bool finished_{false};
};

// Capability contract every effect implements. start runs once before the
// first iteration, loop once per tick, stop exactly once on the way out.
class Effect {
 public:
  virtual ~Effect() = default;

  virtual esp_err_t start(EffectContext& ctx) = 0;
  virtual esp_err_t loop(EffectContext& ctx) = 0;
  virtual void stop(EffectContext& ctx) = 0;
};
