#include "rgbfx_effects.hpp"

std::vector<EffectDescriptor> builtin_effects() {
  return {
      static_effect(),
      breathing_effect(),
      rainbow_effect(),
      random_colors_effect(),
      police_lights_effect(),
      lightning_effect(),
      audio_effect(),
      audio_loopback_effect(),
      desktop_effect(),
  };
}

esp_err_t builtin_registry(EffectRegistry& registry) {
  return registry.discover(builtin_effects());
}
