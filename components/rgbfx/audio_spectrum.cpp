#include "rgbfx/audio_spectrum.hpp"
#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

static const char* TAG = "rgbfx-audio";

namespace {

struct FftBin {
  float re{0.0f};
  float im{0.0f};
};

constexpr Rgb8 kBandPalette[] = {
    colors::kRed, colors::kOrange, colors::kYellow, colors::kGreen, colors::kBlue, colors::kViolet,
};

size_t next_pow2(size_t n) {
  size_t p = 1;
  while (p < n) {
    p <<= 1;
  }
  return p;
}

void apply_hann(std::vector<float>& buf, size_t count) {
  if (count < 2) {
    return;
  }
  for (size_t i = 0; i < count; ++i) {
    float w = 0.5f * (1.0f - cosf(2.0f * static_cast<float>(M_PI) * i / (count - 1)));
    buf[i] *= w;
  }
}

void fft(std::vector<FftBin>& data) {
  const size_t n = data.size();
  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) {
      j ^= bit;
    }
    j ^= bit;
    if (i < j) {
      std::swap(data[i], data[j]);
    }
  }
  for (size_t len = 2; len <= n; len <<= 1) {
    const float ang = -2.0f * static_cast<float>(M_PI) / len;
    const FftBin wlen{cosf(ang), sinf(ang)};
    for (size_t i = 0; i < n; i += len) {
      FftBin w{1.0f, 0.0f};
      for (size_t j = 0; j < len / 2; ++j) {
        FftBin u = data[i + j];
        const FftBin& odd = data[i + j + len / 2];
        FftBin v{odd.re * w.re - odd.im * w.im, odd.re * w.im + odd.im * w.re};
        data[i + j].re = u.re + v.re;
        data[i + j].im = u.im + v.im;
        data[i + j + len / 2].re = u.re - v.re;
        data[i + j + len / 2].im = u.im - v.im;
        const float new_re = w.re * wlen.re - w.im * wlen.im;
        w.im = w.re * wlen.im + w.im * wlen.re;
        w.re = new_re;
      }
    }
  }
}

}  // namespace

std::vector<float> magnitude_spectrum(const std::vector<float>& frame) {
  if (frame.empty()) {
    return {};
  }
  const size_t fft_size = std::max<size_t>(2, next_pow2(frame.size()));
  std::vector<float> windowed = frame;
  apply_hann(windowed, windowed.size());
  windowed.resize(fft_size, 0.0f);

  std::vector<FftBin> bins(fft_size);
  for (size_t i = 0; i < fft_size; ++i) {
    bins[i].re = windowed[i];
  }
  fft(bins);

  const float norm = 1.0f / static_cast<float>(fft_size);
  std::vector<float> magn(fft_size / 2 + 1);
  for (size_t i = 0; i < magn.size(); ++i) {
    magn[i] = sqrtf(bins[i].re * bins[i].re + bins[i].im * bins[i].im) * norm;
  }
  return magn;
}

float band_energy(const std::vector<float>& magnitudes, uint32_t sample_rate, size_t fft_size,
                  float low_hz, float high_hz) {
  if (magnitudes.empty() || sample_rate == 0 || fft_size == 0) {
    return 0.0f;
  }
  const float bin_hz = static_cast<float>(sample_rate) / fft_size;
  // [low, high): the bin on a shared edge belongs to the upper band. A band
  // reaching Nyquist keeps the last bin.
  const size_t last = magnitudes.size();
  const size_t i_low = std::min(static_cast<size_t>(std::max(0.0f, low_hz) / bin_hz), last - 1);
  size_t i_end = static_cast<size_t>(std::max(0.0f, high_hz) / bin_hz);
  if (high_hz >= static_cast<float>(sample_rate) / 2.0f) {
    i_end = last;
  }
  i_end = std::min(std::max(i_end, i_low + 1), last);
  float acc = 0.0f;
  size_t n = 0;
  for (size_t i = i_low; i < i_end; ++i) {
    acc += magnitudes[i];
    ++n;
  }
  return n > 0 ? acc / n : 0.0f;
}

esp_err_t bands_from_edges(const std::vector<float>& edges, uint32_t sample_rate, std::vector<FrequencyBand>& out) {
  out.clear();
  if (edges.empty() || sample_rate == 0) {
    return RGBFX_ERR_INVALID_VALUE;
  }
  for (size_t i = 0; i < edges.size(); ++i) {
    if (!std::isfinite(edges[i]) || edges[i] <= 0.0f || (i > 0 && edges[i] <= edges[i - 1])) {
      ESP_LOGW(TAG, "Frequency band edges must be positive and increasing (edge %u = %.1f)",
               static_cast<unsigned>(i), edges[i]);
      return RGBFX_ERR_INVALID_VALUE;
    }
  }
  const float nyquist = static_cast<float>(sample_rate) / 2.0f;
  const size_t palette_size = sizeof(kBandPalette) / sizeof(kBandPalette[0]);
  for (size_t i = 0; i < edges.size(); ++i) {
    if (edges[i] >= nyquist) {
      break;
    }
    FrequencyBand band{};
    band.low_hz = edges[i];
    band.high_hz = (i + 1 < edges.size()) ? std::min(edges[i + 1], nyquist) : nyquist;
    band.color = kBandPalette[i % palette_size];
    out.push_back(band);
  }
  if (out.empty()) {
    ESP_LOGW(TAG, "All band edges at or above Nyquist (%.0f Hz)", nyquist);
    return RGBFX_ERR_INVALID_VALUE;
  }
  return ESP_OK;
}

float frame_rms(const std::vector<float>& frame) {
  if (frame.empty()) {
    return 0.0f;
  }
  double acc = 0.0;
  for (float s : frame) {
    acc += static_cast<double>(s) * s;
  }
  return static_cast<float>(std::sqrt(acc / frame.size()));
}

std::vector<std::vector<float>> split_frame(const std::vector<float>& frame, size_t count) {
  std::vector<std::vector<float>> out;
  if (count == 0) {
    return out;
  }
  const size_t window = frame.size() / count;
  for (size_t i = 0; i < count; ++i) {
    auto first = frame.begin() + static_cast<std::ptrdiff_t>(i * window);
    auto last = (i + 1 == count) ? frame.end() : first + static_cast<std::ptrdiff_t>(window);
    out.emplace_back(first, last);
  }
  return out;
}

SpectrumColorMapper::SpectrumColorMapper(std::vector<FrequencyBand> bands, uint32_t sample_rate, float smoothing,
                                         float energy_floor)
    : bands_(std::move(bands)),
      sample_rate_(sample_rate),
      smoothing_(std::clamp(smoothing, 0.0f, kMaxSmoothing)),
      energy_floor_(std::max(0.0f, energy_floor)) {}

bool SpectrumColorMapper::map(const std::vector<float>& frame, Rgb8& composite) {
  energies_.assign(bands_.size(), 0.0f);
  const std::vector<float> magn = magnitude_spectrum(frame);
  if (magn.empty() || bands_.empty()) {
    return false;
  }
  const size_t fft_size = (magn.size() - 1) * 2;
  float total = 0.0f;
  for (size_t i = 0; i < bands_.size(); ++i) {
    energies_[i] = band_energy(magn, sample_rate_, fft_size, bands_[i].low_hz, bands_[i].high_hz);
    if (energies_[i] > energy_floor_) {
      total += energies_[i];
    }
  }
  if (total <= energy_floor_) {
    return false;
  }

  // Running weighted average: each lerp folds one band in by its share so far.
  Rgb8 target{};
  float acc_weight = 0.0f;
  for (size_t i = 0; i < bands_.size(); ++i) {
    if (energies_[i] <= energy_floor_) {
      continue;
    }
    const float weight = energies_[i] / total;
    acc_weight += weight;
    target = lerp_color(target, bands_[i].color, acc_weight > 0.0f ? weight / acc_weight : 1.0f);
  }

  composite = smoothing_ > 0.0f ? lerp_color(target, composite, smoothing_) : target;
  return true;
}

PeakFlash::PeakFlash(float threshold, float duration_s)
    : threshold_(threshold), duration_us_(static_cast<int64_t>(std::max(0.0f, duration_s) * 1000000.0f)) {}

bool PeakFlash::active(int64_t now_us) const {
  return started_us_ >= 0 && now_us - started_us_ < duration_us_;
}

float PeakFlash::update(float rms, int64_t now_us) {
  if (active(now_us)) {
    return 1.0f - static_cast<float>(now_us - started_us_) / static_cast<float>(duration_us_);
  }
  started_us_ = -1;
  if (rms > threshold_) {
    started_us_ = now_us;
    color_ = random_palette_color();
    ++triggers_;
    ESP_LOGD(TAG, "Peak %.3f > %.3f, flashing %s", rms, threshold_, color_to_hex(color_).c_str());
    return 1.0f;
  }
  return 0.0f;
}
