#pragma once
#include "rgbfx/effect_registry.hpp"
#include "esp_err.h"
#include <vector>

EffectDescriptor static_effect();
EffectDescriptor breathing_effect();
EffectDescriptor rainbow_effect();
EffectDescriptor random_colors_effect();
EffectDescriptor police_lights_effect();
EffectDescriptor lightning_effect();
EffectDescriptor audio_effect();
EffectDescriptor audio_loopback_effect();
EffectDescriptor desktop_effect();

// Every built-in effect, in listing order.
std::vector<EffectDescriptor> builtin_effects();
esp_err_t builtin_registry(EffectRegistry& registry);
