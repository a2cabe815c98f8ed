#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/audio_spectrum.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <memory>

static const char* TAG = "fx-audio";

namespace {

class AudioEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    source_ = ctx.audio_source();
    if (!source_) {
      ESP_LOGE(TAG, "No audio capture source attached");
      return ESP_ERR_INVALID_STATE;
    }
    const EffectOptions& opts = ctx.options();
    chunk_size_ = static_cast<size_t>(opts.get_int("chunk_size", 1024));
    timeout_ms_ = static_cast<uint32_t>(opts.get_int("capture_timeout_ms", 100));
    flash_ = std::make_unique<PeakFlash>(opts.get_float("peak_threshold", 0.05f), opts.get_float("peak_duration", 0.1f));
    const uint32_t sample_rate = static_cast<uint32_t>(opts.get_int("sample_rate", 44100));
    esp_err_t err = source_->open(sample_rate, opts.get_int("audio_device", -1), false);
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "Failed to open audio input: %s", rgbfx_err_to_name(err));
      source_ = nullptr;
      return err;
    }
    ESP_LOGI(TAG, "Peak flash at %u Hz, %u samples per frame", static_cast<unsigned>(sample_rate),
             static_cast<unsigned>(chunk_size_));
    return ESP_OK;
  }

  esp_err_t loop(EffectContext& ctx) override {
    esp_err_t err = source_->read_frame(chunk_size_, frame_, timeout_ms_);
    if (err == ESP_ERR_TIMEOUT) {
      ESP_LOGD(TAG, "No audio within %ums", static_cast<unsigned>(timeout_ms_));
      return ESP_OK;
    }
    if (err != ESP_OK) {
      return err;
    }
    const float intensity = flash_->update(frame_rms(frame_), ctx.now_us());
    const Rgb8 color = intensity > 0.0f ? scale_color(flash_->color(), intensity) : colors::kBlack;
    return ctx.set_targets_color(color);
  }

  void stop(EffectContext& ctx) override {
    if (esp_err_t err = ctx.turn_off_targets(); err != ESP_OK) {
      ESP_LOGW(TAG, "Turn off failed: %s", rgbfx_err_to_name(err));
    }
    if (source_) {
      source_->close();
      source_ = nullptr;
    }
  }

 private:
  AudioCaptureSource* source_{nullptr};
  std::unique_ptr<PeakFlash> flash_{};
  std::vector<float> frame_{};
  size_t chunk_size_{1024};
  uint32_t timeout_ms_{100};
};

}  // namespace

EffectDescriptor audio_effect() {
  EffectDescriptor desc{};
  desc.name = "Audio";
  desc.description = "Flash a random color on audio peaks";
  desc.schema = base_option_fields(0.02f);
  desc.schema.push_back(fields::number("sample_rate", OptionKind::Int, "44100", 8000.0f, 192000.0f, "Capture sample rate"));
  desc.schema.push_back(fields::number("chunk_size", OptionKind::Int, "1024", 16.0f, 16384.0f, "Samples per analysed frame"));
  desc.schema.push_back(fields::number("peak_threshold", OptionKind::Float, "0.05", 0.0f, 1.0f, "RMS level that triggers a flash"));
  desc.schema.push_back(fields::number("peak_duration", OptionKind::Float, "0.1", 0.0f, 10.0f, "Seconds a flash takes to fade"));
  desc.schema.push_back(fields::number("audio_device", OptionKind::Int, "-1", -1.0f, 1024.0f, "Input device index, -1 for default"));
  desc.schema.push_back(fields::number("capture_timeout_ms", OptionKind::Int, "100", 1.0f, 10000.0f, "Longest wait for a frame"));
  desc.factory = [] { return std::make_unique<AudioEffect>(); };
  return desc;
}
