#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// Hann-windowed magnitude spectrum, bins 0..N/2 of the next power of two,
// normalised by 1/N.
std::vector<float> magnitude_spectrum(const std::vector<float>& frame);

// Mean magnitude over [low_hz, high_hz), closed at Nyquist; fft_size is the padded transform length.
float band_energy(const std::vector<float>& magnitudes, uint32_t sample_rate, size_t fft_size,
                  float low_hz, float high_hz);

// N increasing edges -> N bands, the last one ending at Nyquist (N-1 when the
// last edge is already at or above it). Colors cycle through the band palette.
esp_err_t bands_from_edges(const std::vector<float>& edges, uint32_t sample_rate, std::vector<FrequencyBand>& out);

float frame_rms(const std::vector<float>& frame);

// Splits frame into count equal windows (the last takes the remainder).
std::vector<std::vector<float>> split_frame(const std::vector<float>& frame, size_t count);

// At 1.0 the held color would never move.
constexpr float kMaxSmoothing = 0.95f;

class SpectrumColorMapper {
 public:
  SpectrumColorMapper(std::vector<FrequencyBand> bands, uint32_t sample_rate, float smoothing = 0.0f,
                      float energy_floor = 1.0e-6f);

  // Blend band colors by relative energy into composite. Returns false and
  // leaves composite untouched for a silent frame.
  bool map(const std::vector<float>& frame, Rgb8& composite);
  const std::vector<float>& last_energies() const { return energies_; }
  const std::vector<FrequencyBand>& bands() const { return bands_; }

 private:
  std::vector<FrequencyBand> bands_;
  uint32_t sample_rate_;
  float smoothing_;
  float energy_floor_;
  std::vector<float> energies_{};
};

// Flash on loud frames, fading linearly to black over duration_s.
class PeakFlash {
 public:
  PeakFlash(float threshold, float duration_s);

  // Feed one frame's RMS; returns the intensity to apply at now_us (0..1).
  float update(float rms, int64_t now_us);
  bool active(int64_t now_us) const;
  const Rgb8& color() const { return color_; }
  uint32_t triggers() const { return triggers_; }

 private:
  float threshold_;
  int64_t duration_us_;
  int64_t started_us_{-1};
  Rgb8 color_{};
  uint32_t triggers_{0};
};
