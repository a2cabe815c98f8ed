#include "rgbfx/effect_registry.hpp"
#include "rgbfx/errors.hpp"
#include "text_util.hpp"
#include "cJSON.h"
#include "esp_log.h"
#include <utility>

static const char* TAG = "rgbfx-registry";

esp_err_t EffectRegistry::discover(const std::vector<EffectDescriptor>& units) {
  effects_.clear();
  std::vector<EffectDescriptor> found;
  found.reserve(units.size());
  for (const auto& unit : units) {
    if (unit.name.empty() || !unit.factory) {
      ESP_LOGE(TAG, "Effect unit without name or factory");
      return ESP_ERR_INVALID_ARG;
    }
    const std::string key = text_util::lower_copy(unit.name);
    for (const auto& existing : found) {
      if (text_util::lower_copy(existing.name) == key) {
        ESP_LOGE(TAG, "Duplicate effect '%s' (already registered as '%s')", unit.name.c_str(),
                 existing.name.c_str());
        return RGBFX_ERR_DUPLICATE_EFFECT;
      }
    }
    // Defaults must parse, otherwise every run of this effect would fail.
    EffectOptions defaults;
    std::string detail;
    esp_err_t err = options_merge(unit.schema, {}, defaults, &detail);
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "Effect '%s' has a bad default (%s)", unit.name.c_str(), detail.c_str());
      return err;
    }
    found.push_back(unit);
  }
  effects_ = std::move(found);
  ESP_LOGI(TAG, "Registered %u effect(s)", static_cast<unsigned>(effects_.size()));
  return ESP_OK;
}

std::vector<std::string> EffectRegistry::list() const {
  std::vector<std::string> names;
  names.reserve(effects_.size());
  for (const auto& effect : effects_) {
    names.push_back(effect.name);
  }
  return names;
}

esp_err_t EffectRegistry::resolve(const std::string& name, const EffectDescriptor*& out) const {
  out = nullptr;
  for (const auto& effect : effects_) {
    if (effect.name == name) {
      out = &effect;
      return ESP_OK;
    }
  }
  const std::string key = text_util::lower_copy(text_util::trim_copy(name));
  for (const auto& effect : effects_) {
    if (text_util::lower_copy(effect.name) == key) {
      out = &effect;
      return ESP_OK;
    }
  }
  ESP_LOGW(TAG, "Unknown effect '%s'", name.c_str());
  return RGBFX_ERR_UNKNOWN_EFFECT;
}

esp_err_t EffectRegistry::describe(const std::string& name, std::vector<OptionSchemaEntry>& entries) const {
  entries.clear();
  const EffectDescriptor* desc = nullptr;
  esp_err_t err = resolve(name, desc);
  if (err != ESP_OK) {
    return err;
  }
  entries = option_schema_entries(desc->schema);
  return ESP_OK;
}

char* EffectRegistry::describe_json(const std::string& name) const {
  const EffectDescriptor* desc = nullptr;
  if (resolve(name, desc) != ESP_OK) {
    return nullptr;
  }
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "name", desc->name.c_str());
  cJSON_AddStringToObject(root, "description", desc->description.c_str());
  cJSON* arr = cJSON_AddArrayToObject(root, "options");
  for (const auto& entry : option_schema_entries(desc->schema)) {
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "name", entry.name.c_str());
    cJSON_AddStringToObject(obj, "default", entry.default_text.c_str());
    cJSON_AddStringToObject(obj, "accepts", entry.accepted_formats.c_str());
    cJSON_AddStringToObject(obj, "help", entry.help.c_str());
    cJSON_AddItemToArray(arr, obj);
  }
  char* txt = cJSON_PrintUnformatted(root);
  cJSON_Delete(root);
  return txt;
}
