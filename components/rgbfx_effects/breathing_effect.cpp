#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <cmath>
#include <memory>

static const char* TAG = "fx-breathing";

namespace {

class BreathingEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    const EffectOptions& opts = ctx.options();
    color_ = opts.get_color("color", colors::kWhite);
    speed_ = opts.get_float("breathing_speed", 2.0f);
    min_level_ = opts.get_float("min_brightness", 0.1f);
    keep_on_stop_ = opts.get_bool("keep_on_stop");
    ESP_LOGI(TAG, "Breathing %s at %.2f Hz, floor %.2f", color_to_hex(color_).c_str(), speed_, min_level_);
    return ESP_OK;
  }

  // Cosine so the first frame is at full level.
  esp_err_t loop(EffectContext& ctx) override {
    const float phase = 2.0f * static_cast<float>(M_PI) * speed_ * ctx.elapsed_s();
    const float level = min_level_ + (1.0f - min_level_) * (cosf(phase) + 1.0f) * 0.5f;
    return ctx.set_targets_color(scale_color(color_, level));
  }

  void stop(EffectContext& ctx) override {
    if (keep_on_stop_) {
      return;
    }
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
  }

 private:
  Rgb8 color_{colors::kWhite};
  float speed_{2.0f};
  float min_level_{0.1f};
  bool keep_on_stop_{false};
};

}  // namespace

EffectDescriptor breathing_effect() {
  EffectDescriptor desc{};
  desc.name = "Breathing";
  desc.description = "Color that fades between a floor and full brightness";
  desc.schema = base_option_fields(0.05f);
  desc.schema.push_back(fields::make("color", OptionKind::Color, "white", "Color to breathe, random picks once"));
  desc.schema.push_back(fields::number("breathing_speed", OptionKind::Float, "2.0", 0.0f, 100.0f, "Breaths per second"));
  desc.schema.push_back(fields::number("min_brightness", OptionKind::Float, "0.1", 0.0f, 1.0f, "Lowest level of a breath"));
  desc.schema.push_back(fields::make("keep_on_stop", OptionKind::Bool, "false", "Leave the color on when stopped"));
  desc.factory = [] { return std::make_unique<BreathingEffect>(); };
  return desc;
}
