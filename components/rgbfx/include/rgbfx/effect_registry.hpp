#pragma once
#include "rgbfx/effect.hpp"
#include "rgbfx/effect_options.hpp"
#include "esp_err.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct EffectDescriptor {
  std::string name{};
  std::string description{};
  std::vector<OptionField> schema{};  // base_option_fields() first
  std::function<std::unique_ptr<Effect>()> factory{};
};

// Name -> descriptor map, filled once by discover() and read-only afterwards.
class EffectRegistry {
 public:
  esp_err_t discover(const std::vector<EffectDescriptor>& units);

  std::vector<std::string> list() const;
  size_t size() const { return effects_.size(); }

  // Exact match first, then case-insensitive.
  esp_err_t resolve(const std::string& name, const EffectDescriptor*& out) const;
  esp_err_t describe(const std::string& name, std::vector<OptionSchemaEntry>& entries) const;
  // Caller frees the returned string with cJSON_free; nullptr on error.
  char* describe_json(const std::string& name) const;

 private:
  std::vector<EffectDescriptor> effects_{};
};
