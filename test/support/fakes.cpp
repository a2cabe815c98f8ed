#include "fakes.hpp"
#include <cmath>

std::vector<float> make_sine(float freq_hz, uint32_t sample_rate, size_t count, float amplitude) {
  std::vector<float> out(count);
  for (size_t i = 0; i < count; ++i) {
    out[i] = amplitude * sinf(2.0f * static_cast<float>(M_PI) * freq_hz * static_cast<float>(i) / sample_rate);
  }
  return out;
}
