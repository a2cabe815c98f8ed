#pragma once
#include "rgbfx/device_sink.hpp"
#include "rgbfx/effect.hpp"
#include "rgbfx/effect_options.hpp"
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Created -> Running -> Stopping -> Stopped for one effect instance.
// Stopped is terminal: running the effect again needs a new lifecycle.
class EffectLifecycle {
 public:
  EffectLifecycle(std::string name,
                  std::unique_ptr<Effect> effect,
                  EffectOptions options,
                  DeviceSink& sink,
                  CaptureSources captures = {});
  ~EffectLifecycle();

  EffectLifecycle(const EffectLifecycle&) = delete;
  EffectLifecycle& operator=(const EffectLifecycle&) = delete;

  // Snapshot devices, resolve targets and run the setup hook.
  esp_err_t start();
  // Drive iterations on the calling thread until stopped, finished or
  // iteration_limit (0 = unbounded) is reached. Teardown always runs.
  esp_err_t run(uint32_t iteration_limit = 0);
  // Safe from any thread; wakes a pending wait.
  void request_stop();

  LifecycleState state() const;
  uint32_t iterations() const { return iterations_.load(); }
  const std::string& name() const { return name_; }
  const EffectOptions& options() const { return options_; }

 private:
  bool wait_for_next_tick(uint32_t delay_ms);
  void teardown();

  std::string name_;
  std::unique_ptr<Effect> effect_;
  EffectOptions options_;
  DeviceSink& sink_;
  std::atomic<bool> stop_requested_{false};
  EffectContext ctx_;
  std::atomic<uint32_t> iterations_{0};
  LifecycleState state_{LifecycleState::Created};
  mutable std::mutex mutex_;
  std::condition_variable wake_;
};

const char* lifecycle_state_name(LifecycleState state);
