#include "rgbfx_effects/screen_sampling.hpp"
#include <algorithm>
#include <unordered_map>

Rgb8 sample_dominant_color(const ScreenFrame& frame, uint8_t tolerance) {
  if (frame.pixels.empty()) {
    return Rgb8{};
  }
  const int step = std::max<int>(1, tolerance);
  auto quantize = [step](uint8_t channel) { return static_cast<uint8_t>((channel / step) * step); };

  std::unordered_map<uint32_t, uint32_t> counts;
  Rgb8 best{};
  uint32_t best_count = 0;
  for (const Rgb8& px : frame.pixels) {
    const Rgb8 q{quantize(px.r), quantize(px.g), quantize(px.b)};
    const uint32_t key = (static_cast<uint32_t>(q.r) << 16) | (static_cast<uint32_t>(q.g) << 8) | q.b;
    const uint32_t count = ++counts[key];
    // Strictly greater: ties go to the bucket that got there first.
    if (count > best_count) {
      best_count = count;
      best = q;
    }
  }
  return best;
}

Rgb8 sample_average_color(const ScreenFrame& frame) {
  if (frame.pixels.empty()) {
    return Rgb8{};
  }
  uint64_t r = 0, g = 0, b = 0;
  for (const Rgb8& px : frame.pixels) {
    r += px.r;
    g += px.g;
    b += px.b;
  }
  const uint64_t n = frame.pixels.size();
  return Rgb8{static_cast<uint8_t>(r / n), static_cast<uint8_t>(g / n), static_cast<uint8_t>(b / n)};
}
