#include "rgbfx.hpp"
#include "rgbfx/color_model.hpp"
#include "esp_log.h"
#include <algorithm>
#include <utility>

static const char* TAG = "rgbfx";

namespace {

bool schema_has(const std::vector<OptionField>& schema, const char* name) {
  return std::any_of(schema.begin(), schema.end(), [&](const OptionField& field) { return field.name == name; });
}

// Engine-wide capture settings go first so per-run overrides still win.
OptionOverrides with_audio_defaults(const RgbFxConfig& cfg,
                                    const std::vector<OptionField>& schema,
                                    const OptionOverrides& overrides) {
  OptionOverrides out;
  auto add = [&](const char* key, const std::string& value) {
    if (schema_has(schema, key)) {
      out.emplace_back(key, value);
    }
  };
  add("sample_rate", std::to_string(cfg.audio.sample_rate));
  add("chunk_size", std::to_string(cfg.audio.chunk_size));
  add("audio_device", std::to_string(cfg.audio.device_index));
  add("use_loopback", cfg.audio.loopback ? "true" : "false");
  add("capture_timeout_ms", std::to_string(cfg.audio.capture_timeout_ms));
  out.insert(out.end(), overrides.begin(), overrides.end());
  return out;
}

}  // namespace

RgbFxController::RgbFxController(DeviceSink& sink) : sink_(sink) {}

RgbFxController::~RgbFxController() {
  stop();
  if (task_ && join_effect_task(2000) == ESP_ERR_TIMEOUT) {
    ESP_LOGE(TAG, "Effect task did not stop, deleting it");
    vTaskDelete(task_);
    task_ = nullptr;
  }
}

esp_err_t RgbFxController::init(const RgbFxConfig& cfg, const std::vector<EffectDescriptor>& units) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    return ESP_ERR_INVALID_STATE;
  }
  cfg_ = cfg;
  esp_log_level_set("*", config_log_level(cfg_));
  esp_err_t err = registry_.discover(units);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Effect discovery failed: %s", rgbfx_err_to_name(err));
    initialized_ = false;
    return err;
  }
  initialized_ = true;
  ESP_LOGI(TAG, "Initialized with %u effect(s), %u preset(s)", static_cast<unsigned>(registry_.size()),
           static_cast<unsigned>(cfg_.presets.size()));
  return ESP_OK;
}

esp_err_t RgbFxController::connect() {
  esp_err_t err = sink_.connect();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to connect to lighting server: %s", rgbfx_err_to_name(err));
    return RGBFX_ERR_CONNECTION;
  }
  const std::vector<DeviceInfo> devices = sink_.list_devices();
  ESP_LOGI(TAG, "Connected, %u device(s)", static_cast<unsigned>(devices.size()));
  for (const auto& dev : devices) {
    ESP_LOGI(TAG, "  [%u] %s (%s, %u LEDs)", dev.index, dev.name.c_str(), dev.type.c_str(), dev.led_count);
  }
  return ESP_OK;
}

void RgbFxController::disconnect() {
  stop();
  sink_.disconnect();
}

bool RgbFxController::connected() const {
  return sink_.connected();
}

std::vector<std::string> RgbFxController::list_effects() const {
  return registry_.list();
}

esp_err_t RgbFxController::describe_effect(const std::string& name, std::vector<OptionSchemaEntry>& entries) const {
  return registry_.describe(name, entries);
}

esp_err_t RgbFxController::prepare(const std::string& name,
                                   const OptionOverrides& overrides,
                                   std::string* detail,
                                   std::unique_ptr<EffectLifecycle>& out) const {
  if (!initialized_) {
    return ESP_ERR_INVALID_STATE;
  }
  if (!sink_.connected()) {
    ESP_LOGW(TAG, "Not connected, cannot run %s", name.c_str());
    return ESP_ERR_INVALID_STATE;
  }
  const EffectDescriptor* desc = nullptr;
  esp_err_t err = registry_.resolve(name, desc);
  if (err != ESP_OK) {
    if (detail) {
      *detail = "unknown effect '" + name + "'";
    }
    return err;
  }
  EffectOptions options;
  err = options_merge(desc->schema, with_audio_defaults(cfg_, desc->schema, overrides), options, detail);
  if (err != ESP_OK) {
    return err;
  }
  std::unique_ptr<Effect> effect = desc->factory();
  if (!effect) {
    ESP_LOGE(TAG, "Factory for %s returned nothing", desc->name.c_str());
    return ESP_ERR_NO_MEM;
  }
  out = std::make_unique<EffectLifecycle>(desc->name, std::move(effect), std::move(options), sink_, captures_);
  return ESP_OK;
}

esp_err_t RgbFxController::claim(std::unique_ptr<EffectLifecycle> lifecycle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    ESP_LOGW(TAG, "%s is already running", active_->name().c_str());
    return ESP_ERR_INVALID_STATE;
  }
  active_ = std::move(lifecycle);
  return ESP_OK;
}

esp_err_t RgbFxController::drive(uint32_t iteration_limit) {
  EffectLifecycle* lifecycle = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycle = active_.get();
  }
  if (!lifecycle) {
    return ESP_ERR_INVALID_STATE;
  }
  esp_err_t err = lifecycle->run(iteration_limit);
  std::unique_ptr<EffectLifecycle> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished = std::move(active_);
  }
  return err;
}

esp_err_t RgbFxController::run_effect(const std::string& name,
                                      const OptionOverrides& overrides,
                                      uint32_t iteration_limit,
                                      std::string* detail) {
  std::unique_ptr<EffectLifecycle> lifecycle;
  esp_err_t err = prepare(name, overrides, detail, lifecycle);
  if (err != ESP_OK) {
    return err;
  }
  err = claim(std::move(lifecycle));
  if (err != ESP_OK) {
    return err;
  }
  return drive(iteration_limit);
}

esp_err_t RgbFxController::run_effect_text(const std::string& name,
                                           const std::string& options,
                                           uint32_t iteration_limit,
                                           std::string* detail) {
  OptionOverrides overrides;
  esp_err_t err = options_overrides_from_string(options, overrides);
  if (err != ESP_OK) {
    if (detail) {
      *detail = "malformed option string '" + options + "'";
    }
    return err;
  }
  return run_effect(name, overrides, iteration_limit, detail);
}

esp_err_t RgbFxController::run_preset(const std::string& preset, uint32_t iteration_limit) {
  const EffectPreset* found = config_find_preset(cfg_, preset);
  if (!found) {
    ESP_LOGW(TAG, "Unknown preset '%s'", preset.c_str());
    return ESP_ERR_NOT_FOUND;
  }
  ESP_LOGI(TAG, "Preset %s -> %s [%s]", found->name.c_str(), found->effect.c_str(), found->options.c_str());
  return run_effect_text(found->effect, found->options, iteration_limit);
}

esp_err_t RgbFxController::run_default(uint32_t iteration_limit) {
  if (cfg_.default_effect.empty()) {
    ESP_LOGW(TAG, "No default effect configured");
    return ESP_ERR_NOT_FOUND;
  }
  return run_effect(cfg_.default_effect, {}, iteration_limit);
}

esp_err_t RgbFxController::start_effect_task(const std::string& name,
                                             const OptionOverrides& overrides,
                                             uint32_t iteration_limit,
                                             std::string* detail) {
  if (task_ && !task_done_.load()) {
    return ESP_ERR_INVALID_STATE;
  }
  task_ = nullptr;
  std::unique_ptr<EffectLifecycle> lifecycle;
  esp_err_t err = prepare(name, overrides, detail, lifecycle);
  if (err != ESP_OK) {
    return err;
  }
  err = claim(std::move(lifecycle));
  if (err != ESP_OK) {
    return err;
  }
  task_iteration_limit_ = iteration_limit;
  task_result_ = ESP_OK;
  task_done_ = false;
  const BaseType_t res = xTaskCreatePinnedToCore(task_entry, "rgbfx_fx", 4096, this, 4, &task_, tskNO_AFFINITY);
  if (res != pdPASS) {
    ESP_LOGE(TAG, "Failed to start effect task");
    task_ = nullptr;
    task_done_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    active_.reset();
    return ESP_ERR_NO_MEM;
  }
  return ESP_OK;
}

void RgbFxController::task_entry(void* arg) {
  auto* self = reinterpret_cast<RgbFxController*>(arg);
  if (self) {
    self->task_result_ = self->drive(self->task_iteration_limit_);
    self->task_done_ = true;
  }
  vTaskDelete(nullptr);
}

esp_err_t RgbFxController::join_effect_task(uint32_t timeout_ms) {
  if (!task_) {
    return ESP_OK;
  }
  uint32_t waited = 0;
  while (!task_done_.load()) {
    if (waited >= timeout_ms) {
      return ESP_ERR_TIMEOUT;
    }
    vTaskDelay(pdMS_TO_TICKS(10));
    waited += 10;
  }
  task_ = nullptr;
  return task_result_;
}

void RgbFxController::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    ESP_LOGI(TAG, "Stopping %s", active_->name().c_str());
    active_->request_stop();
  }
}

bool RgbFxController::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}

std::string RgbFxController::active_effect() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ ? active_->name() : std::string{};
}

esp_err_t RgbFxController::turn_off_all() {
  if (running()) {
    return ESP_ERR_INVALID_STATE;
  }
  if (!sink_.connected()) {
    return ESP_ERR_INVALID_STATE;
  }
  esp_err_t result = ESP_OK;
  for (const auto& dev : sink_.list_devices()) {
    esp_err_t err = sink_.set_color(dev, colors::kBlack);
    if (err == RGBFX_ERR_SINK_DISCONNECTED || (err != ESP_OK && result == ESP_OK)) {
      result = err;
    }
  }
  return result;
}

void RgbFxController::set_audio_source(AudioCaptureSource* source) {
  std::lock_guard<std::mutex> lock(mutex_);
  captures_.audio = source;
}

void RgbFxController::set_screen_source(ScreenCaptureSource* source) {
  std::lock_guard<std::mutex> lock(mutex_);
  captures_.screen = source;
}
