#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <memory>

static const char* TAG = "fx-static";

namespace {

class StaticEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    color_ = ctx.options().get_color("color", colors::kWhite);
    keep_on_stop_ = ctx.options().get_bool("keep_on_stop");
    ESP_LOGI(TAG, "Static %s", color_to_hex(color_).c_str());
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    return ctx.set_targets_color(color_);
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
  bool keep_on_stop_{false};
};

}  // namespace

EffectDescriptor static_effect() {
  EffectDescriptor desc{};
  desc.name = "Static";
  desc.description = "Solid color on every target device";
  desc.schema = base_option_fields(1.0f);
  desc.schema.push_back(fields::make("color", OptionKind::Color, "white", "Color to show"));
  desc.schema.push_back(fields::make("keep_on_stop", OptionKind::Bool, "false", "Leave the color on when stopped"));
  desc.factory = [] { return std::make_unique<StaticEffect>(); };
  return desc;
}
