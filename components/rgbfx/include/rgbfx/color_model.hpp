#pragma once
#include "rgbfx/types.hpp"
#include "esp_err.h"
#include <cstddef>
#include <string>
#include <vector>

namespace colors {
constexpr Rgb8 kBlack{0, 0, 0};
constexpr Rgb8 kWhite{255, 255, 255};
constexpr Rgb8 kRed{255, 0, 0};
constexpr Rgb8 kOrange{255, 127, 0};
constexpr Rgb8 kYellow{255, 255, 0};
constexpr Rgb8 kGreen{0, 255, 0};
constexpr Rgb8 kBlue{0, 0, 255};
constexpr Rgb8 kIndigo{75, 0, 130};
constexpr Rgb8 kViolet{148, 0, 211};
}  // namespace colors

// Parse a color: palette name (case-insensitive), "#RRGGBB", "R,G,B" (clamped) or "random".
// Returns RGBFX_ERR_INVALID_COLOR for anything else. was_random is set when the
// channels were drawn at random.
esp_err_t color_parse(const std::string& text, Rgb8& out, bool* was_random = nullptr);

// Parse a brightness: float (clamped to 0..1), "NN%" or "random" (drawn once).
// Returns RGBFX_ERR_INVALID_BRIGHTNESS for anything else.
esp_err_t brightness_parse(const std::string& text, float& out);

// Per-channel linear interpolation, t clamped to [0, 1].
Rgb8 lerp_color(const Rgb8& a, const Rgb8& b, float t);

// Multiply every channel by factor (clamped to [0, 1]).
Rgb8 scale_color(const Rgb8& color, float factor);

// Rainbow sequence, index wraps modulo its length.
Rgb8 rainbow_color(size_t index);
size_t rainbow_size();

// Named palette in declaration order.
std::vector<Rgb8> palette_colors(bool include_black);
Rgb8 random_palette_color();
Rgb8 random_color();

std::string color_to_hex(const Rgb8& color);
