#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <memory>

static const char* TAG = "fx-rainbow";

namespace {

class RainbowEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    const EffectOptions& opts = ctx.options();
    smooth_ = opts.get_bool("smooth_transition", true);
    steps_ = static_cast<uint32_t>(opts.get_int("steps_per_color", 30));
    step_delay_ms_ = static_cast<uint32_t>(opts.get_float("transition_delay", 0.03f) * 1000.0f + 0.5f);
    index_ = 0;
    step_ = 0;
    ESP_LOGI(TAG, "Rainbow %s, %u steps per color", smooth_ ? "smooth" : "discrete", static_cast<unsigned>(steps_));
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    if (!smooth_) {
      const Rgb8 color = rainbow_color(index_);
      index_ = (index_ + 1) % rainbow_size();
      return ctx.set_targets_color(color);
    }
    const float t = static_cast<float>(step_) / static_cast<float>(steps_);
    const Rgb8 color = lerp_color(rainbow_color(index_), rainbow_color(index_ + 1), t);
    if (++step_ >= steps_) {
      step_ = 0;
      index_ = (index_ + 1) % rainbow_size();
    }
    ctx.set_next_delay_ms(step_delay_ms_);
    return ctx.set_targets_color(color);
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
  }

 private:
  bool smooth_{true};
  uint32_t steps_{30};
  uint32_t step_delay_ms_{30};
  size_t index_{0};
  uint32_t step_{0};
};

}  // namespace

EffectDescriptor rainbow_effect() {
  EffectDescriptor desc{};
  desc.name = "Rainbow";
  desc.description = "Cycle through the rainbow, stepped or blended";
  desc.schema = base_option_fields(0.2f);
  desc.schema.push_back(fields::make("smooth_transition", OptionKind::Bool, "true", "Blend between neighbouring colors"));
  desc.schema.push_back(fields::number("steps_per_color", OptionKind::Int, "30", 1.0f, 1000.0f, "Blend steps from one color to the next"));
  desc.schema.push_back(fields::number("transition_delay", OptionKind::Float, "0.03", 0.0f, 60.0f, "Seconds between blend steps"));
  desc.factory = [] { return std::make_unique<RainbowEffect>(); };
  return desc;
}
