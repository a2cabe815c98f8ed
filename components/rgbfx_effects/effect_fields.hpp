#pragma once
#include "rgbfx/effect_options.hpp"
#include <string>
#include <utility>
#include <vector>

// Schema builders shared by the built-in effects.
namespace fields {

inline OptionField make(const char* name, OptionKind kind, std::string default_text, const char* help) {
  OptionField field{};
  field.name = name;
  field.kind = kind;
  field.default_text = std::move(default_text);
  field.help = help;
  return field;
}

inline OptionField number(const char* name, OptionKind kind, std::string default_text, float min_value,
                          float max_value, const char* help) {
  OptionField field = make(name, kind, std::move(default_text), help);
  field.min_value = min_value;
  field.max_value = max_value;
  return field;
}

inline OptionField choice(const char* name, std::vector<std::string> choices, const char* help) {
  OptionField field = make(name, OptionKind::Choice, choices.empty() ? std::string{} : choices.front(), help);
  field.choices = std::move(choices);
  return field;
}

}  // namespace fields
