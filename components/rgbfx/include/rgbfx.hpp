#pragma once
#include "rgbfx/capture_source.hpp"
#include "rgbfx/config.hpp"
#include "rgbfx/device_sink.hpp"
#include "rgbfx/effect_lifecycle.hpp"
#include "rgbfx/effect_options.hpp"
#include "rgbfx/effect_registry.hpp"
#include "rgbfx/errors.hpp"
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class RgbFxController {
public:
  explicit RgbFxController(DeviceSink& sink);
  ~RgbFxController();

  RgbFxController(const RgbFxController&) = delete;
  RgbFxController& operator=(const RgbFxController&) = delete;

  esp_err_t init(const RgbFxConfig& cfg, const std::vector<EffectDescriptor>& units);
  const RgbFxConfig& config() const { return cfg_; }
  const EffectRegistry& registry() const { return registry_; }

  esp_err_t connect();
  void disconnect();
  bool connected() const;

  std::vector<std::string> list_effects() const;
  esp_err_t describe_effect(const std::string& name, std::vector<OptionSchemaEntry>& entries) const;

  // Blocks until the effect stops. iteration_limit 0 runs until stop().
  esp_err_t run_effect(const std::string& name,
                       const OptionOverrides& overrides,
                       uint32_t iteration_limit = 0,
                       std::string* detail = nullptr);
  esp_err_t run_effect_text(const std::string& name,
                            const std::string& options,
                            uint32_t iteration_limit = 0,
                            std::string* detail = nullptr);
  esp_err_t run_preset(const std::string& preset, uint32_t iteration_limit = 0);
  // Runs cfg.default_effect with its schema defaults.
  esp_err_t run_default(uint32_t iteration_limit = 0);

  // Same flow on a FreeRTOS task; setup errors are returned before the task starts.
  esp_err_t start_effect_task(const std::string& name,
                              const OptionOverrides& overrides,
                              uint32_t iteration_limit = 0,
                              std::string* detail = nullptr);
  // ESP_ERR_TIMEOUT while the task is still running, else the run's result.
  esp_err_t join_effect_task(uint32_t timeout_ms);

  void stop();
  bool running() const;
  std::string active_effect() const;

  esp_err_t turn_off_all();

  void set_audio_source(AudioCaptureSource* source);
  void set_screen_source(ScreenCaptureSource* source);

private:
  static void task_entry(void* arg);
  esp_err_t prepare(const std::string& name,
                    const OptionOverrides& overrides,
                    std::string* detail,
                    std::unique_ptr<EffectLifecycle>& out) const;
  esp_err_t claim(std::unique_ptr<EffectLifecycle> lifecycle);
  esp_err_t drive(uint32_t iteration_limit);

  DeviceSink& sink_;
  RgbFxConfig cfg_{};
  EffectRegistry registry_{};
  CaptureSources captures_{};
  std::unique_ptr<EffectLifecycle> active_{};
  TaskHandle_t task_{nullptr};
  uint32_t task_iteration_limit_{0};
  std::atomic<bool> task_done_{true};
  esp_err_t task_result_{ESP_OK};
  bool initialized_{false};
  mutable std::mutex mutex_;
};
