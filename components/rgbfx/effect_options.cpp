#include "rgbfx/effect_options.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "text_util.hpp"
#include "cJSON.h"
#include "esp_log.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

static const char* TAG = "rgbfx-options";

namespace {

void set_detail(std::string* detail, const std::string& text) {
  if (detail) {
    *detail = text;
  }
}

bool in_bounds(const OptionField& field, float value) {
  return value >= field.min_value && value <= field.max_value;
}

esp_err_t parse_bool(const std::string& text, bool& out) {
  const std::string t = text_util::lower_copy(text_util::trim_copy(text));
  if (t == "true" || t == "1" || t == "yes" || t == "on") {
    out = true;
    return ESP_OK;
  }
  if (t == "false" || t == "0" || t == "no" || t == "off") {
    out = false;
    return ESP_OK;
  }
  return RGBFX_ERR_INVALID_VALUE;
}

esp_err_t parse_device_list(const std::string& text, DeviceSelector& out) {
  const std::string t = text_util::lower_copy(text_util::strip_brackets(text));
  out = DeviceSelector{};
  if (t.empty() || t == "all" || t == "none") {
    return ESP_OK;
  }
  out.all = false;
  for (const auto& part : text_util::split_any(t, ",;")) {
    long index = 0;
    if (!text_util::parse_long(part, index)) {
      return RGBFX_ERR_INVALID_VALUE;
    }
    out.indices.push_back(static_cast<int>(index));
  }
  return ESP_OK;
}

esp_err_t parse_float_list(const std::string& text, std::vector<float>& out) {
  const std::string t = text_util::strip_brackets(text);
  out.clear();
  if (text_util::trim_copy(t).empty()) {
    return ESP_OK;
  }
  for (const auto& part : text_util::split_any(t, ",;")) {
    float value = 0.0f;
    if (!text_util::parse_float(part, value) || !std::isfinite(value)) {
      return RGBFX_ERR_INVALID_VALUE;
    }
    out.push_back(value);
  }
  return ESP_OK;
}

esp_err_t parse_color_list(const std::string& text, std::vector<Rgb8>& out) {
  const std::string trimmed = text_util::trim_copy(text);
  const bool bracketed = trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']';
  const std::string t = text_util::strip_brackets(trimmed);
  out.clear();
  if (text_util::trim_copy(t).empty()) {
    return ESP_OK;
  }
  std::vector<std::string> parts;
  if (t.find_first_of(";|") != std::string::npos) {
    parts = text_util::split_any(t, ";|");
  } else if (bracketed) {
    parts = text_util::split_any(t, ",");
  } else {
    parts.push_back(t);
  }
  for (const auto& part : parts) {
    Rgb8 color{};
    const esp_err_t err = color_parse(part, color);
    if (err != ESP_OK) {
      return err;
    }
    out.push_back(color);
  }
  return ESP_OK;
}

std::string format_number(double value) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.9g", value);
  return buf;
}

}  // namespace

float EffectOptions::sleep_s() const {
  return get_float("sleep_s", 0.1f);
}

const DeviceSelector& EffectOptions::devices() const {
  const OptionValue* v = find("devices");
  return v ? v->devices : all_devices_;
}

float EffectOptions::max_brightness() const {
  return get_float("max_brightness", 1.0f);
}

bool EffectOptions::has(const std::string& name) const {
  return find(name) != nullptr;
}

float EffectOptions::get_float(const std::string& name, float fallback) const {
  const OptionValue* v = find(name);
  return v ? v->number : fallback;
}

int EffectOptions::get_int(const std::string& name, int fallback) const {
  const OptionValue* v = find(name);
  return v ? static_cast<int>(v->number) : fallback;
}

bool EffectOptions::get_bool(const std::string& name, bool fallback) const {
  const OptionValue* v = find(name);
  return v ? v->flag : fallback;
}

std::string EffectOptions::get_string(const std::string& name, const std::string& fallback) const {
  const OptionValue* v = find(name);
  return v ? v->text : fallback;
}

Rgb8 EffectOptions::get_color(const std::string& name, const Rgb8& fallback) const {
  const OptionValue* v = find(name);
  return v ? v->color : fallback;
}

bool EffectOptions::color_is_random(const std::string& name) const {
  const OptionValue* v = find(name);
  return v && v->random;
}

std::vector<float> EffectOptions::get_float_list(const std::string& name) const {
  const OptionValue* v = find(name);
  return v ? v->numbers : std::vector<float>{};
}

std::vector<Rgb8> EffectOptions::get_color_list(const std::string& name) const {
  const OptionValue* v = find(name);
  return v ? v->colors : std::vector<Rgb8>{};
}

void EffectOptions::set(const std::string& name, const OptionValue& value) {
  for (auto& entry : values_) {
    if (entry.first == name) {
      entry.second = value;
      return;
    }
  }
  values_.emplace_back(name, value);
}

const OptionValue* EffectOptions::find(const std::string& name) const {
  for (const auto& entry : values_) {
    if (entry.first == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

std::vector<OptionField> base_option_fields(float sleep_default) {
  std::vector<OptionField> fields;
  OptionField sleep{};
  sleep.name = "sleep_s";
  sleep.kind = OptionKind::Float;
  char buf[16];
  snprintf(buf, sizeof(buf), "%g", static_cast<double>(sleep_default));
  sleep.default_text = buf;
  sleep.min_value = 0.0f;
  sleep.max_value = 3600.0f;
  sleep.help = "Delay between iterations in seconds";
  fields.push_back(sleep);

  OptionField devices{};
  devices.name = "devices";
  devices.kind = OptionKind::DeviceList;
  devices.default_text = "all";
  devices.help = "Device indices to target, empty or all for every device";
  fields.push_back(devices);

  OptionField brightness{};
  brightness.name = "max_brightness";
  brightness.kind = OptionKind::Brightness;
  brightness.default_text = "1.0";
  brightness.help = "Brightness multiplier applied to every push";
  fields.push_back(brightness);
  return fields;
}

esp_err_t option_parse_value(const OptionField& field, const std::string& text, OptionValue& out) {
  out = OptionValue{};
  out.kind = field.kind;
  out.text = text_util::trim_copy(text);

  switch (field.kind) {
    case OptionKind::Float: {
      float value = 0.0f;
      if (!text_util::parse_float(out.text, value) || !std::isfinite(value) || !in_bounds(field, value)) {
        return RGBFX_ERR_INVALID_VALUE;
      }
      out.number = value;
      return ESP_OK;
    }
    case OptionKind::Int: {
      long value = 0;
      if (!text_util::parse_long(out.text, value) || !in_bounds(field, static_cast<float>(value))) {
        return RGBFX_ERR_INVALID_VALUE;
      }
      out.number = static_cast<float>(value);
      return ESP_OK;
    }
    case OptionKind::Bool:
      return parse_bool(out.text, out.flag);
    case OptionKind::String:
      return ESP_OK;
    case OptionKind::Choice: {
      const std::string key = text_util::lower_copy(out.text);
      for (const auto& choice : field.choices) {
        if (text_util::lower_copy(choice) == key) {
          out.text = choice;
          return ESP_OK;
        }
      }
      return RGBFX_ERR_INVALID_VALUE;
    }
    case OptionKind::Color:
      return color_parse(out.text, out.color, &out.random);
    case OptionKind::Brightness:
      return brightness_parse(out.text, out.number);
    case OptionKind::DeviceList:
      return parse_device_list(out.text, out.devices);
    case OptionKind::FloatList:
      return parse_float_list(out.text, out.numbers);
    case OptionKind::ColorList:
      return parse_color_list(out.text, out.colors);
  }
  return RGBFX_ERR_INVALID_VALUE;
}

esp_err_t options_merge(const std::vector<OptionField>& schema,
                        const OptionOverrides& overrides,
                        EffectOptions& out,
                        std::string* detail) {
  out = EffectOptions{};
  for (const auto& [key, value] : overrides) {
    const std::string name = text_util::trim_copy(key);
    const bool known = std::any_of(schema.begin(), schema.end(),
                                   [&](const OptionField& field) { return field.name == name; });
    if (!known) {
      set_detail(detail, "unknown option '" + name + "'");
      ESP_LOGW(TAG, "Unknown option '%s'", name.c_str());
      return RGBFX_ERR_UNKNOWN_OPTION;
    }
  }

  for (const auto& field : schema) {
    const std::string* source = &field.default_text;
    // Last occurrence of a key wins.
    for (const auto& [key, value] : overrides) {
      if (text_util::trim_copy(key) == field.name) {
        source = &value;
      }
    }
    OptionValue parsed{};
    const esp_err_t err = option_parse_value(field, *source, parsed);
    if (err != ESP_OK) {
      set_detail(detail, field.name + ": invalid value '" + *source + "' (expected " +
                             option_accepted_formats(field) + ")");
      ESP_LOGW(TAG, "Option %s rejected '%s': %s", field.name.c_str(), source->c_str(),
               rgbfx_err_to_name(err));
      return err;
    }
    out.set(field.name, parsed);
  }
  return ESP_OK;
}

esp_err_t options_overrides_from_string(const std::string& text, OptionOverrides& out) {
  out.clear();
  std::vector<std::string> tokens;
  std::string current;
  int depth = 0;
  for (char ch : text) {
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      depth = std::max(0, depth - 1);
    }
    if (ch == ',' && depth == 0) {
      tokens.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  tokens.push_back(current);

  for (const auto& raw : tokens) {
    const std::string token = text_util::trim_copy(raw);
    if (token.empty()) {
      continue;
    }
    const size_t eq = token.find('=');
    const bool opens_list = !token.empty() && token.front() == '[';
    if (eq == std::string::npos || opens_list) {
      if (out.empty()) {
        ESP_LOGW(TAG, "Option string token '%s' has no key", token.c_str());
        return RGBFX_ERR_INVALID_VALUE;
      }
      out.back().second += "," + token;
      continue;
    }
    const std::string key = text_util::trim_copy(token.substr(0, eq));
    if (key.empty()) {
      ESP_LOGW(TAG, "Option string token '%s' has an empty key", token.c_str());
      return RGBFX_ERR_INVALID_VALUE;
    }
    out.emplace_back(key, text_util::trim_copy(token.substr(eq + 1)));
  }
  return ESP_OK;
}

esp_err_t options_overrides_from_json(const cJSON* obj, OptionOverrides& out) {
  out.clear();
  if (!cJSON_IsObject(obj)) {
    return ESP_ERR_INVALID_ARG;
  }
  const cJSON* item = nullptr;
  cJSON_ArrayForEach(item, obj) {
    if (!item->string || cJSON_IsNull(item)) {
      continue;
    }
    if (cJSON_IsBool(item)) {
      out.emplace_back(item->string, cJSON_IsTrue(item) ? "true" : "false");
    } else if (cJSON_IsNumber(item)) {
      out.emplace_back(item->string, format_number(item->valuedouble));
    } else if (cJSON_IsString(item)) {
      out.emplace_back(item->string, item->valuestring);
    } else if (cJSON_IsArray(item)) {
      std::string joined = "[";
      const cJSON* entry = nullptr;
      bool first = true;
      cJSON_ArrayForEach(entry, item) {
        if (!first) {
          joined += ",";
        }
        first = false;
        if (cJSON_IsNumber(entry)) {
          joined += format_number(entry->valuedouble);
        } else if (cJSON_IsString(entry)) {
          joined += entry->valuestring;
        } else {
          ESP_LOGW(TAG, "Option %s has a non-scalar list entry", item->string);
          return RGBFX_ERR_INVALID_VALUE;
        }
      }
      joined += "]";
      out.emplace_back(item->string, joined);
    } else {
      ESP_LOGW(TAG, "Option %s has an unsupported JSON type", item->string);
      return RGBFX_ERR_INVALID_VALUE;
    }
  }
  return ESP_OK;
}

std::string option_accepted_formats(const OptionField& field) {
  switch (field.kind) {
    case OptionKind::Float:
      return "number";
    case OptionKind::Int:
      return "integer";
    case OptionKind::Bool:
      return "true|false";
    case OptionKind::String:
      return "text";
    case OptionKind::Choice: {
      std::string out;
      for (const auto& choice : field.choices) {
        if (!out.empty()) {
          out += "|";
        }
        out += choice;
      }
      return out;
    }
    case OptionKind::Color:
      return "name|#RRGGBB|R,G,B|random";
    case OptionKind::Brightness:
      return "0.0-1.0|NN%|random";
    case OptionKind::DeviceList:
      return "all|[i,j,...]";
    case OptionKind::FloatList:
      return "[n,n,...]";
    case OptionKind::ColorList:
      return "color;color;...";
  }
  return "text";
}

std::vector<OptionSchemaEntry> option_schema_entries(const std::vector<OptionField>& schema) {
  std::vector<OptionSchemaEntry> entries;
  entries.reserve(schema.size());
  for (const auto& field : schema) {
    entries.push_back(OptionSchemaEntry{field.name, field.default_text, option_accepted_formats(field), field.help});
  }
  return entries;
}
