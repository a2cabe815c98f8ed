#include "rgbfx/config.hpp"
#include "rgbfx/effect_options.hpp"
#include "text_util.hpp"
#include "cJSON.h"
#include <algorithm>

static const char* TAG = "rgbfx-config";

namespace {

constexpr uint32_t CURRENT_SCHEMA = 1;

const char* kLogLevels[] = {"none", "error", "warn", "info", "debug", "verbose"};

std::string normalize_log_level(const std::string& value) {
  const std::string lower = text_util::lower_copy(text_util::trim_copy(value));
  for (const char* level : kLogLevels) {
    if (lower == level) {
      return lower;
    }
  }
  if (lower == "warning") {
    return "warn";
  }
  ESP_LOGW(TAG, "Unknown log level '%s', keeping info", value.c_str());
  return "info";
}

std::string join_overrides(const OptionOverrides& overrides) {
  std::string out;
  for (const auto& [key, value] : overrides) {
    if (!out.empty()) {
      out += ",";
    }
    out += key + "=" + value;
  }
  return out;
}

void decode_audio(RgbFxConfig& cfg, cJSON* audio) {
  if (cJSON* sr = cJSON_GetObjectItem(audio, "sample_rate"); cJSON_IsNumber(sr)) {
    cfg.audio.sample_rate = static_cast<uint32_t>(std::clamp(sr->valuedouble, 8000.0, 192000.0));
  }
  if (cJSON* chunk = cJSON_GetObjectItem(audio, "chunk_size"); cJSON_IsNumber(chunk)) {
    cfg.audio.chunk_size = static_cast<uint32_t>(std::clamp(chunk->valuedouble, 64.0, 16384.0));
  }
  if (cJSON* lb = cJSON_GetObjectItem(audio, "loopback"); cJSON_IsBool(lb)) {
    cfg.audio.loopback = cJSON_IsTrue(lb);
  }
  if (cJSON* dev = cJSON_GetObjectItem(audio, "device_index"); cJSON_IsNumber(dev)) {
    cfg.audio.device_index = static_cast<int>(std::clamp(dev->valuedouble, -1.0, 1024.0));
  }
  if (cJSON* timeout = cJSON_GetObjectItem(audio, "capture_timeout_ms"); cJSON_IsNumber(timeout)) {
    cfg.audio.capture_timeout_ms = static_cast<uint32_t>(std::clamp(timeout->valuedouble, 1.0, 10000.0));
  }
}

void decode_presets(RgbFxConfig& cfg, cJSON* arr) {
  cfg.presets.clear();
  cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, arr) {
    if (!cJSON_IsObject(entry)) {
      continue;
    }
    EffectPreset preset{};
    if (cJSON* name = cJSON_GetObjectItem(entry, "name"); cJSON_IsString(name)) preset.name = name->valuestring;
    if (cJSON* effect = cJSON_GetObjectItem(entry, "effect"); cJSON_IsString(effect)) preset.effect = effect->valuestring;
    if (cJSON* opts = cJSON_GetObjectItem(entry, "options"); cJSON_IsString(opts)) {
      preset.options = opts->valuestring;
    } else if (cJSON_IsObject(opts)) {
      OptionOverrides overrides;
      if (options_overrides_from_json(opts, overrides) == ESP_OK) {
        preset.options = join_overrides(overrides);
      }
    }
    if (preset.name.empty() || preset.effect.empty()) {
      ESP_LOGW(TAG, "Skipping preset without name or effect");
      continue;
    }
    auto same = [&](const EffectPreset& p) { return p.name == preset.name; };
    auto it = std::find_if(cfg.presets.begin(), cfg.presets.end(), same);
    if (it != cfg.presets.end()) {
      *it = preset;
    } else {
      cfg.presets.push_back(preset);
    }
  }
}

}  // namespace

void config_reset_defaults(RgbFxConfig& cfg) {
  cfg = RgbFxConfig{};
  cfg.schema_version = CURRENT_SCHEMA;
}

esp_err_t config_apply_json(RgbFxConfig& cfg, const char* data, size_t len) {
  if (!data || len == 0) {
    return ESP_ERR_INVALID_ARG;
  }
  cJSON* root = cJSON_ParseWithLength(data, len);
  if (!root) {
    ESP_LOGW(TAG, "Failed to parse config JSON");
    return ESP_ERR_INVALID_ARG;
  }
  if (!cJSON_IsObject(root)) {
    cJSON_Delete(root);
    return ESP_ERR_INVALID_ARG;
  }

  if (cJSON* level = cJSON_GetObjectItem(root, "log_level"); cJSON_IsString(level)) {
    cfg.log_level = normalize_log_level(level->valuestring);
  }
  if (cJSON* def = cJSON_GetObjectItem(root, "default_effect"); cJSON_IsString(def)) {
    cfg.default_effect = def->valuestring;
  }
  if (cJSON* audio = cJSON_GetObjectItem(root, "audio"); cJSON_IsObject(audio)) {
    decode_audio(cfg, audio);
  }
  if (cJSON* presets = cJSON_GetObjectItem(root, "presets"); cJSON_IsArray(presets)) {
    decode_presets(cfg, presets);
  }
  if (cJSON* schema = cJSON_GetObjectItem(root, "schema_version"); cJSON_IsNumber(schema)) {
    cfg.schema_version = static_cast<uint32_t>(schema->valuedouble);
  }
  if (cfg.schema_version > CURRENT_SCHEMA) {
    ESP_LOGW(TAG, "Config schema %u is newer than %u", static_cast<unsigned>(cfg.schema_version),
             static_cast<unsigned>(CURRENT_SCHEMA));
  }

  cJSON_Delete(root);
  return ESP_OK;
}

std::string config_to_json(const RgbFxConfig& cfg) {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddNumberToObject(root, "schema_version", CURRENT_SCHEMA);
  cJSON_AddStringToObject(root, "log_level", cfg.log_level.c_str());
  cJSON_AddStringToObject(root, "default_effect", cfg.default_effect.c_str());

  cJSON* audio = cJSON_AddObjectToObject(root, "audio");
  cJSON_AddNumberToObject(audio, "sample_rate", cfg.audio.sample_rate);
  cJSON_AddNumberToObject(audio, "chunk_size", cfg.audio.chunk_size);
  cJSON_AddBoolToObject(audio, "loopback", cfg.audio.loopback);
  cJSON_AddNumberToObject(audio, "device_index", cfg.audio.device_index);
  cJSON_AddNumberToObject(audio, "capture_timeout_ms", cfg.audio.capture_timeout_ms);

  cJSON* arr = cJSON_AddArrayToObject(root, "presets");
  for (const auto& preset : cfg.presets) {
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "name", preset.name.c_str());
    cJSON_AddStringToObject(obj, "effect", preset.effect.c_str());
    cJSON_AddStringToObject(obj, "options", preset.options.c_str());
    cJSON_AddItemToArray(arr, obj);
  }

  char* txt = cJSON_PrintUnformatted(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}

esp_log_level_t config_log_level(const RgbFxConfig& cfg) {
  const std::string level = normalize_log_level(cfg.log_level);
  if (level == "none") return ESP_LOG_NONE;
  if (level == "error") return ESP_LOG_ERROR;
  if (level == "warn") return ESP_LOG_WARN;
  if (level == "debug") return ESP_LOG_DEBUG;
  if (level == "verbose") return ESP_LOG_VERBOSE;
  return ESP_LOG_INFO;
}

const EffectPreset* config_find_preset(const RgbFxConfig& cfg, const std::string& name) {
  for (const auto& preset : cfg.presets) {
    if (preset.name == name) {
      return &preset;
    }
  }
  const std::string key = text_util::lower_copy(name);
  for (const auto& preset : cfg.presets) {
    if (text_util::lower_copy(preset.name) == key) {
      return &preset;
    }
  }
  return nullptr;
}
