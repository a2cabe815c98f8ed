#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <memory>

static const char* TAG = "fx-police";

namespace {

constexpr uint32_t kGapMs = 50;

struct PoliceStep {
  Rgb8 color;
  uint32_t hold_ms;
};

// Two blue flashes, pause, two red flashes, pause; one step per iteration.
class PoliceLightsEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    const uint32_t flash_ms = static_cast<uint32_t>(ctx.options().get_int("flash_duration_ms", 100));
    const uint32_t pause_ms =
        static_cast<uint32_t>(ctx.options().get_float("pause_duration_s", 0.5f) * 1000.0f + 0.5f);
    sequence_.clear();
    for (const Rgb8& color : {colors::kBlue, colors::kRed}) {
      sequence_.push_back({color, flash_ms});
      sequence_.push_back({colors::kBlack, kGapMs});
      sequence_.push_back({color, flash_ms});
      sequence_.push_back({colors::kBlack, kGapMs + pause_ms});
    }
    position_ = 0;
    ESP_LOGI(TAG, "Police lights, flash %ums, pause %ums", static_cast<unsigned>(flash_ms),
             static_cast<unsigned>(pause_ms));
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    const PoliceStep& step = sequence_[position_];
    position_ = (position_ + 1) % sequence_.size();
    ctx.set_next_delay_ms(step.hold_ms);
    return ctx.set_targets_color(step.color);
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
  }

 private:
  std::vector<PoliceStep> sequence_{};
  size_t position_{0};
};

}  // namespace

EffectDescriptor police_lights_effect() {
  EffectDescriptor desc{};
  desc.name = "PoliceLights";
  desc.description = "Alternating blue and red double flashes";
  desc.schema = base_option_fields(0.1f);
  desc.schema.push_back(fields::number("flash_duration_ms", OptionKind::Int, "100", 1.0f, 10000.0f, "Length of one flash"));
  desc.schema.push_back(fields::number("pause_duration_s", OptionKind::Float, "0.5", 0.0f, 60.0f, "Pause after each color pair"));
  desc.factory = [] { return std::make_unique<PoliceLightsEffect>(); };
  return desc;
}
