#pragma once
#include "esp_err.h"

#define RGBFX_ERR_BASE 0x1A000

#define RGBFX_ERR_CONNECTION (RGBFX_ERR_BASE + 1)          // sink unreachable
#define RGBFX_ERR_UNKNOWN_EFFECT (RGBFX_ERR_BASE + 2)
#define RGBFX_ERR_UNKNOWN_OPTION (RGBFX_ERR_BASE + 3)
#define RGBFX_ERR_UNKNOWN_DEVICE (RGBFX_ERR_BASE + 4)      // index dropped, run continues
#define RGBFX_ERR_INVALID_COLOR (RGBFX_ERR_BASE + 5)
#define RGBFX_ERR_INVALID_BRIGHTNESS (RGBFX_ERR_BASE + 6)
#define RGBFX_ERR_INVALID_VALUE (RGBFX_ERR_BASE + 7)
#define RGBFX_ERR_DUPLICATE_EFFECT (RGBFX_ERR_BASE + 8)
#define RGBFX_ERR_SINK_DISCONNECTED (RGBFX_ERR_BASE + 9)   // fatal inside a run

// Names rgbfx codes, falls back to esp_err_to_name for everything else.
const char* rgbfx_err_to_name(esp_err_t err);
