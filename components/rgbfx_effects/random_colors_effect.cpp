#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include "esp_random.h"
#include <memory>

static const char* TAG = "fx-random";

namespace {

class RandomColorsEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    per_device_ = ctx.options().get_bool("per_device", true);
    palette_ = ctx.options().get_color_list("color_palette");
    if (palette_.empty()) {
      palette_ = palette_colors(false);
    }
    ESP_LOGI(TAG, "Random colors from %u entries, %s", static_cast<unsigned>(palette_.size()),
             per_device_ ? "per device" : "shared");
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    if (!per_device_) {
      return ctx.set_targets_color(pick());
    }
    std::vector<Rgb8> picks;
    picks.reserve(ctx.targets().size());
    for (size_t i = 0; i < ctx.targets().size(); ++i) {
      picks.push_back(pick());
    }
    return ctx.push_per_device(picks);
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
  }

 private:
  Rgb8 pick() const {
    return palette_[esp_random() % palette_.size()];
  }

  bool per_device_{true};
  std::vector<Rgb8> palette_{};
};

}  // namespace

EffectDescriptor random_colors_effect() {
  EffectDescriptor desc{};
  desc.name = "RandomColors";
  desc.description = "New random palette color every iteration";
  desc.schema = base_option_fields(0.5f);
  desc.schema.push_back(fields::make("per_device", OptionKind::Bool, "true", "Pick a separate color per device"));
  desc.schema.push_back(fields::make("color_palette", OptionKind::ColorList, "", "Colors to pick from, empty for the named palette"));
  desc.factory = [] { return std::make_unique<RandomColorsEffect>(); };
  return desc;
}
