#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <string>
#include <utility>
#include <vector>

struct cJSON;

enum class OptionKind {
  Float,
  Int,
  Bool,
  String,
  Choice,
  Color,
  Brightness,
  DeviceList,
  FloatList,
  ColorList,
};

struct OptionField {
  std::string name{};
  OptionKind kind{OptionKind::String};
  std::string default_text{};        // option-string form, parsed like an override
  std::vector<std::string> choices{};  // Choice only
  float min_value{-1.0e9f};            // Float/Int bounds
  float max_value{1.0e9f};
  std::string help{};
};

struct OptionValue {
  OptionKind kind{OptionKind::String};
  float number{0.0f};
  bool flag{false};
  bool random{false};  // Color drawn from "random"
  std::string text{};  // source text, normalized choice for Choice
  Rgb8 color{};
  DeviceSelector devices{};
  std::vector<float> numbers{};
  std::vector<Rgb8> colors{};
};

// Ordered (key, value-text) pairs as supplied by a caller.
using OptionOverrides = std::vector<std::pair<std::string, std::string>>;

struct OptionSchemaEntry {
  std::string name{};
  std::string default_text{};
  std::string accepted_formats{};
  std::string help{};
};

class EffectOptions {
 public:
  float sleep_s() const;
  const DeviceSelector& devices() const;
  float max_brightness() const;

  bool has(const std::string& name) const;
  float get_float(const std::string& name, float fallback = 0.0f) const;
  int get_int(const std::string& name, int fallback = 0) const;
  bool get_bool(const std::string& name, bool fallback = false) const;
  std::string get_string(const std::string& name, const std::string& fallback = {}) const;
  Rgb8 get_color(const std::string& name, const Rgb8& fallback = Rgb8{}) const;
  bool color_is_random(const std::string& name) const;
  std::vector<float> get_float_list(const std::string& name) const;
  std::vector<Rgb8> get_color_list(const std::string& name) const;

  const std::vector<std::pair<std::string, OptionValue>>& values() const { return values_; }
  void set(const std::string& name, const OptionValue& value);

 private:
  const OptionValue* find(const std::string& name) const;

  std::vector<std::pair<std::string, OptionValue>> values_{};
  DeviceSelector all_devices_{};
};

// sleep_s, devices and max_brightness; every schema starts with these.
std::vector<OptionField> base_option_fields(float sleep_default);

// Parse one value with the parser of its field.
esp_err_t option_parse_value(const OptionField& field, const std::string& text, OptionValue& out);

// defaults + overrides -> options. Unknown keys fail with RGBFX_ERR_UNKNOWN_OPTION,
// malformed values fail with the parser's error; detail names the field.
esp_err_t options_merge(const std::vector<OptionField>& schema,
                        const OptionOverrides& overrides,
                        EffectOptions& out,
                        std::string* detail = nullptr);

// "key=value,key=value". Brackets are atomic and a token without '=' extends
// the previous value, so "color=255,0,0,sleep_s=0.2" keeps the triple.
esp_err_t options_overrides_from_string(const std::string& text, OptionOverrides& out);

// {"key": value, ...} with numbers, booleans, strings or arrays.
esp_err_t options_overrides_from_json(const cJSON* obj, OptionOverrides& out);

std::string option_accepted_formats(const OptionField& field);
std::vector<OptionSchemaEntry> option_schema_entries(const std::vector<OptionField>& schema);
