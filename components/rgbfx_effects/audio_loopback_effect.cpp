#include "rgbfx_effects.hpp"
#include "effect_fields.hpp"
#include "rgbfx/audio_spectrum.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <algorithm>
#include <memory>

static const char* TAG = "fx-loopback";

namespace {

class AudioLoopbackEffect : public Effect {
 public:
  esp_err_t start(EffectContext& ctx) override {
    source_ = ctx.audio_source();
    if (!source_) {
      ESP_LOGE(TAG, "No audio capture source attached");
      return ESP_ERR_INVALID_STATE;
    }
    const EffectOptions& opts = ctx.options();
    const uint32_t sample_rate = static_cast<uint32_t>(opts.get_int("sample_rate", 44100));
    chunk_size_ = static_cast<size_t>(opts.get_int("chunk_size", 1024));
    timeout_ms_ = static_cast<uint32_t>(opts.get_int("capture_timeout_ms", 100));
    per_device_ = opts.get_bool("per_device");

    std::vector<FrequencyBand> bands;
    esp_err_t err = bands_from_edges(opts.get_float_list("frequency_bands"), sample_rate, bands);
    if (err != ESP_OK) {
      source_ = nullptr;
      return err;
    }
    const size_t mapper_count = per_device_ ? std::max<size_t>(1, ctx.targets().size()) : 1;
    const float smoothing = opts.get_float("smoothing", 0.0f);
    mappers_.clear();
    for (size_t i = 0; i < mapper_count; ++i) {
      mappers_.emplace_back(bands, sample_rate, smoothing);
    }
    held_.assign(mapper_count, colors::kBlack);

    err = source_->open(sample_rate, opts.get_int("audio_device", -1), opts.get_bool("use_loopback", true));
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "Failed to open audio input: %s", rgbfx_err_to_name(err));
      source_ = nullptr;
      return err;
    }
    ESP_LOGI(TAG, "%u band(s), %s, %u Hz", static_cast<unsigned>(bands.size()),
             per_device_ ? "per device" : "shared", static_cast<unsigned>(sample_rate));
    return ESP_OK;
  }

  // Silent or missing frames keep the held colors.
  esp_err_t loop(EffectContext& ctx) override {
    esp_err_t err = source_->read_frame(chunk_size_, frame_, timeout_ms_);
    if (err == ESP_ERR_TIMEOUT) {
      ESP_LOGD(TAG, "No audio within %ums", static_cast<unsigned>(timeout_ms_));
      return ESP_OK;
    }
    if (err != ESP_OK) {
      return err;
    }
    if (!per_device_) {
      mappers_[0].map(frame_, held_[0]);
      return ctx.set_targets_color(held_[0]);
    }
    const std::vector<std::vector<float>> windows = split_frame(frame_, mappers_.size());
    for (size_t i = 0; i < mappers_.size(); ++i) {
      mappers_[i].map(windows[i], held_[i]);
    }
    return ctx.push_per_device(held_);
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
  std::vector<SpectrumColorMapper> mappers_{};
  std::vector<Rgb8> held_{};
  std::vector<float> frame_{};
  size_t chunk_size_{1024};
  uint32_t timeout_ms_{100};
  bool per_device_{false};
};

}  // namespace

EffectDescriptor audio_loopback_effect() {
  EffectDescriptor desc{};
  desc.name = "AudioLoopback";
  desc.description = "Color from the frequency content of system audio";
  desc.schema = base_option_fields(0.02f);
  desc.schema.push_back(fields::number("sample_rate", OptionKind::Int, "44100", 8000.0f, 192000.0f, "Capture sample rate"));
  desc.schema.push_back(fields::number("chunk_size", OptionKind::Int, "1024", 16.0f, 16384.0f, "Samples per analysed frame"));
  desc.schema.push_back(fields::make("frequency_bands", OptionKind::FloatList, "[60,250,500,2000,4000,8000]",
                                     "Lower band edges in Hz, the last band runs to Nyquist"));
  desc.schema.push_back(fields::make("per_device", OptionKind::Bool, "false", "Analyse one window of the frame per device"));
  desc.schema.push_back(fields::make("use_loopback", OptionKind::Bool, "true", "Capture system output instead of a microphone"));
  desc.schema.push_back(fields::number("audio_device", OptionKind::Int, "-1", -1.0f, 1024.0f, "Input device index, -1 for default"));
  desc.schema.push_back(fields::number("smoothing", OptionKind::Float, "0.0", 0.0f, kMaxSmoothing, "Share of the previous color kept per frame"));
  desc.schema.push_back(fields::number("capture_timeout_ms", OptionKind::Int, "100", 1.0f, 10000.0f, "Longest wait for a frame"));
  desc.factory = [] { return std::make_unique<AudioLoopbackEffect>(); };
  return desc;
}
