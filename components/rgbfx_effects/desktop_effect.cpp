#include "rgbfx_effects.hpp"
#include "rgbfx_effects/screen_sampling.hpp"
#include "effect_fields.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <memory>

static const char* TAG = "fx-desktop";

namespace {

class DesktopEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    source_ = ctx.screen_source();
    if (!source_) {
      ESP_LOGE(TAG, "No screen capture source attached");
      return ESP_ERR_INVALID_STATE;
    }
    const EffectOptions& opts = ctx.options();
    interval_us_ = static_cast<int64_t>(opts.get_int("capture_interval_ms", 100)) * 1000;
    dominant_ = opts.get_string("color_sampling", "dominant") == "dominant";
    tolerance_ = static_cast<uint8_t>(opts.get_int("color_tolerance", 30));
    smooth_ = opts.get_bool("smooth_transitions", true);
    transition_us_ = static_cast<int64_t>(opts.get_int("transition_duration_ms", 200)) * 1000;
    current_ = colors::kBlack;
    from_ = colors::kBlack;
    target_ = colors::kBlack;
    last_capture_us_ = -1;
    ESP_LOGI(TAG, "Desktop %s sampling every %lldms", dominant_ ? "dominant" : "average",
             static_cast<long long>(interval_us_ / 1000));
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    const int64_t now = ctx.now_us();
    if (last_capture_us_ < 0 || now - last_capture_us_ >= interval_us_) {
      capture(now);
    }
    if (smooth_ && transition_us_ > 0) {
      const float t = static_cast<float>(now - transition_start_us_) / static_cast<float>(transition_us_);
      current_ = lerp_color(from_, target_, t);
    } else {
      current_ = target_;
    }
    return ctx.set_targets_color(current_);
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
    source_ = nullptr;
  }

 private:
  // A missed frame keeps the current target.
  void capture(int64_t now) {
    last_capture_us_ = now;
    const uint32_t timeout_ms = static_cast<uint32_t>(interval_us_ / 1000);
    esp_err_t err = source_->capture_frame(frame_, timeout_ms);
    if (err != ESP_OK) {
      ESP_LOGD(TAG, "No screen frame: %s", rgbfx_err_to_name(err));
      return;
    }
    const Rgb8 sampled = dominant_ ? sample_dominant_color(frame_, tolerance_) : sample_average_color(frame_);
    if (sampled == target_) {
      return;
    }
    from_ = current_;
    target_ = sampled;
    transition_start_us_ = now;
  }

  ScreenCaptureSource* source_{nullptr};
  ScreenFrame frame_{};
  int64_t interval_us_{100000};
  int64_t transition_us_{200000};
  int64_t transition_start_us_{0};
  int64_t last_capture_us_{-1};
  bool dominant_{true};
  bool smooth_{true};
  uint8_t tolerance_{30};
  Rgb8 current_{};
  Rgb8 from_{};
  Rgb8 target_{};
};

}  // namespace

EffectDescriptor desktop_effect() {
  EffectDescriptor desc{};
  desc.name = "Desktop";
  desc.description = "Mirror the dominant or average screen color";
  desc.schema = base_option_fields(0.1f);
  desc.schema.push_back(fields::number("capture_interval_ms", OptionKind::Int, "100", 1.0f, 60000.0f, "Time between screen captures"));
  desc.schema.push_back(fields::choice("color_sampling", {"dominant", "average"}, "How a frame becomes one color"));
  desc.schema.push_back(fields::number("color_tolerance", OptionKind::Int, "30", 0.0f, 255.0f, "Quantisation step for dominant sampling"));
  desc.schema.push_back(fields::make("smooth_transitions", OptionKind::Bool, "true", "Blend towards each new color"));
  desc.schema.push_back(fields::number("transition_duration_ms", OptionKind::Int, "200", 0.0f, 60000.0f, "Length of a blend"));
  desc.factory = [] { return std::make_unique<DesktopEffect>(); };
  return desc;
}
