#pragma once
#include "rgbfx/types.hpp"
#include <cstdint>

// Most common color after quantising each channel down to a multiple of
// tolerance (0 is treated as 1). Black for an empty frame.
Rgb8 sample_dominant_color(const ScreenFrame& frame, uint8_t tolerance);
// Per-channel mean. Black for an empty frame.
Rgb8 sample_average_color(const ScreenFrame& frame);
