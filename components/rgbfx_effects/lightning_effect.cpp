#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include "esp_random.h"
#include <algorithm>
#include <memory>

static const char* TAG = "fx-lightning";

namespace {

constexpr uint32_t kFadeStepMs = 10;

class LightningEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    const EffectOptions& opts = ctx.options();
    base_color_ = opts.get_color("color", colors::kWhite);
    random_color_ = opts.color_is_random("color");
    random_target_ = opts.get_string("target_mode", "random") == "random";
    fade_min_ms_ = static_cast<uint32_t>(opts.get_int("fade_min_ms", 100));
    fade_max_ms_ = static_cast<uint32_t>(opts.get_int("fade_max_ms", 500));
    flash_ms_ = static_cast<uint32_t>(opts.get_int("flash_duration_ms", 50));
    if (fade_min_ms_ > fade_max_ms_) {
      ESP_LOGE(TAG, "fade_min_ms %u > fade_max_ms %u", static_cast<unsigned>(fade_min_ms_),
               static_cast<unsigned>(fade_max_ms_));
      return RGBFX_ERR_INVALID_VALUE;
    }
    striking_ = false;
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    if (!striking_) {
      return strike(ctx);
    }
    ++fade_step_;
    const float level = 1.0f - static_cast<float>(fade_step_) / static_cast<float>(fade_steps_);
    esp_err_t err = ctx.set_targets_color(scale_color(color_, level));
    if (fade_step_ >= fade_steps_) {
      striking_ = false;  // default sleep_s until the next strike
    } else {
      ctx.set_next_delay_ms(kFadeStepMs);
    }
    return err;
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
  }

 private:
  // Full-power flash, then fade_steps_ dimming steps.
  esp_err_t strike(EffectContext& ctx) {
    if (random_target_) {
      ctx.reselect_random_target();
    } else {
      ctx.use_all_targets();
    }
    color_ = random_color_ ? random_color() : base_color_;
    const uint32_t span = fade_max_ms_ - fade_min_ms_;
    const uint32_t fade_ms = fade_min_ms_ + (span > 0 ? esp_random() % (span + 1) : 0);
    fade_steps_ = std::max<uint32_t>(1, fade_ms / kFadeStepMs);
    fade_step_ = 0;
    striking_ = true;
    ESP_LOGD(TAG, "Strike %s on %u device(s), fade %ums", color_to_hex(color_).c_str(),
             static_cast<unsigned>(ctx.targets().size()), static_cast<unsigned>(fade_ms));
    ctx.set_next_delay_ms(flash_ms_);
    return ctx.set_targets_color_raw(color_);
  }

  Rgb8 base_color_{colors::kWhite};
  Rgb8 color_{colors::kWhite};
  bool random_color_{false};
  bool random_target_{true};
  uint32_t fade_min_ms_{100};
  uint32_t fade_max_ms_{500};
  uint32_t flash_ms_{50};
  uint32_t fade_steps_{1};
  uint32_t fade_step_{0};
  bool striking_{false};
};

}  // namespace

EffectDescriptor lightning_effect() {
  EffectDescriptor desc{};
  desc.name = "Lightning";
  desc.description = "Random flashes that fade out, like a thunderstorm";
  desc.schema = base_option_fields(0.5f);
  desc.schema.push_back(fields::make("color", OptionKind::Color, "white", "Flash color, random picks per strike"));
  desc.schema.push_back(fields::choice("target_mode", {"random", "all"}, "Strike one random device or all of them"));
  desc.schema.push_back(fields::number("fade_min_ms", OptionKind::Int, "100", 0.0f, 60000.0f, "Shortest fade"));
  desc.schema.push_back(fields::number("fade_max_ms", OptionKind::Int, "500", 0.0f, 60000.0f, "Longest fade"));
  desc.schema.push_back(fields::number("flash_duration_ms", OptionKind::Int, "50", 0.0f, 10000.0f, "Full-power hold before fading"));
  desc.factory = [] { return std::make_unique<LightningEffect>(); };
  return desc;
}
