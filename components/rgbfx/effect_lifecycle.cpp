#include "rgbfx/effect_lifecycle.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/device_targeting.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include "esp_timer.h"
#include <algorithm>
#include <chrono>
#include <utility>

static const char* TAG = "rgbfx-lifecycle";

EffectContext::EffectContext(DeviceSink& sink, const EffectOptions& options, const CaptureSources& captures)
    : sink_(sink), options_(options), captures_(captures) {}

void EffectContext::reselect_random_target() {
  targets_ = pick_random_device(all_targets_);
}

void EffectContext::use_all_targets() {
  targets_ = all_targets_;
}

esp_err_t EffectContext::push(const std::vector<DeviceInfo>& devices, const Rgb8& color) {
  esp_err_t result = ESP_OK;
  for (const auto& device : devices) {
    esp_err_t err = sink_.set_color(device, color);
    if (err == RGBFX_ERR_SINK_DISCONNECTED) {
      result = err;
      continue;
    }
    if (err != ESP_OK && result == ESP_OK) {
      ESP_LOGD(TAG, "push to device %u (%s) failed: %s", device.index, device.name.c_str(),
               rgbfx_err_to_name(err));
      result = ESP_FAIL;
    }
  }
  return result;
}

esp_err_t EffectContext::set_targets_color(const Rgb8& color) {
  return push(targets_, scale_color(color, options_.max_brightness()));
}

esp_err_t EffectContext::set_targets_color_raw(const Rgb8& color) {
  return push(targets_, color);
}

esp_err_t EffectContext::set_device_color(const DeviceInfo& device, const Rgb8& color) {
  return push({device}, scale_color(color, options_.max_brightness()));
}

esp_err_t EffectContext::push_per_device(const std::vector<Rgb8>& colors) {
  esp_err_t result = ESP_OK;
  const size_t count = std::min(colors.size(), targets_.size());
  for (size_t i = 0; i < count; ++i) {
    esp_err_t err = set_device_color(targets_[i], colors[i]);
    if (err == RGBFX_ERR_SINK_DISCONNECTED || (err != ESP_OK && result == ESP_OK)) {
      result = err;
    }
  }
  return result;
}

esp_err_t EffectContext::turn_off_targets() {
  return push(all_targets_, colors::kBlack);
}

void EffectContext::set_next_delay_ms(uint32_t delay_ms) {
  next_delay_ms_ = delay_ms;
}

int64_t EffectContext::now_us() const {
  return esp_timer_get_time();
}

EffectLifecycle::EffectLifecycle(std::string name,
                                 std::unique_ptr<Effect> effect,
                                 EffectOptions options,
                                 DeviceSink& sink,
                                 CaptureSources captures)
    : name_(std::move(name)),
      effect_(std::move(effect)),
      options_(std::move(options)),
      sink_(sink),
      ctx_(sink, options_, captures) {
  ctx_.stop_flag_ = &stop_requested_;
}

EffectLifecycle::~EffectLifecycle() {
  request_stop();
  LifecycleState current = state();
  if (current == LifecycleState::Running) {
    teardown();
  }
}

LifecycleState EffectLifecycle::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

esp_err_t EffectLifecycle::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Created) {
      return ESP_ERR_INVALID_STATE;
    }
  }
  if (!effect_) {
    return ESP_ERR_INVALID_ARG;
  }

  std::vector<DeviceInfo> live = sink_.list_devices();
  esp_err_t err = resolve_target_devices(options_.devices(), live, ctx_.all_targets_);
  if (err != ESP_OK && err != RGBFX_ERR_UNKNOWN_DEVICE) {
    return err;
  }
  ctx_.targets_ = ctx_.all_targets_;
  if (ctx_.all_targets_.empty()) {
    ESP_LOGW(TAG, "%s: no target devices, pushes will be no-ops", name_.c_str());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = LifecycleState::Running;
  }
  ESP_LOGI(TAG, "%s: starting on %u device(s), sleep %.3fs, brightness %.2f", name_.c_str(),
           static_cast<unsigned>(ctx_.all_targets_.size()), options_.sleep_s(), options_.max_brightness());

  err = effect_->start(ctx_);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "%s: setup failed: %s", name_.c_str(), rgbfx_err_to_name(err));
    teardown();
    return err;
  }
  return ESP_OK;
}

esp_err_t EffectLifecycle::run(uint32_t iteration_limit) {
  if (state() == LifecycleState::Created) {
    esp_err_t err = start();
    if (err != ESP_OK) {
      return err;
    }
  }
  if (state() != LifecycleState::Running) {
    return ESP_ERR_INVALID_STATE;
  }

  esp_err_t result = ESP_OK;
  const int64_t default_delay_ms = static_cast<int64_t>(options_.sleep_s() * 1000.0f + 0.5f);
  while (!stop_requested_.load() && !ctx_.finished_) {
    ctx_.next_delay_ms_ = -1;
    esp_err_t err = effect_->loop(ctx_);
    uint32_t done = ++iterations_;
    if (err == RGBFX_ERR_SINK_DISCONNECTED) {
      ESP_LOGE(TAG, "%s: sink disconnected, stopping", name_.c_str());
      result = err;
      break;
    }
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "%s: iteration %u failed: %s", name_.c_str(), static_cast<unsigned>(done),
               rgbfx_err_to_name(err));
    }
    if (ctx_.finished_ || (iteration_limit > 0 && done >= iteration_limit)) {
      break;
    }
    const int64_t delay_ms = ctx_.next_delay_ms_ >= 0 ? ctx_.next_delay_ms_ : default_delay_ms;
    if (!wait_for_next_tick(static_cast<uint32_t>(delay_ms))) {
      break;
    }
    ctx_.elapsed_us_ += delay_ms * 1000;
  }

  teardown();
  return result;
}

void EffectLifecycle::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_.exchange(true)) {
      return;
    }
  }
  ESP_LOGD(TAG, "%s: stop requested", name_.c_str());
  wake_.notify_all();
}

bool EffectLifecycle::wait_for_next_tick(uint32_t delay_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (delay_ms > 0) {
    wake_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] { return stop_requested_.load(); });
  }
  return !stop_requested_.load();
}

void EffectLifecycle::teardown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Running) {
      if (state_ == LifecycleState::Created) {
        state_ = LifecycleState::Stopped;
      }
      return;
    }
    state_ = LifecycleState::Stopping;
  }
  effect_->stop(ctx_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = LifecycleState::Stopped;
  }
  ESP_LOGI(TAG, "%s: stopped after %u iteration(s)", name_.c_str(), static_cast<unsigned>(iterations_.load()));
}

const char* lifecycle_state_name(LifecycleState state) {
  switch (state) {
    case LifecycleState::Created:
      return "created";
    case LifecycleState::Running:
      return "running";
    case LifecycleState::Stopping:
      return "stopping";
    case LifecycleState::Stopped:
      return "stopped";
  }
  return "unknown";
}
