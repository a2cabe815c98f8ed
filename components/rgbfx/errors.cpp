#include "rgbfx/errors.hpp"

const char* rgbfx_err_to_name(esp_err_t err) {
  switch (err) {
    case RGBFX_ERR_CONNECTION:
      return "RGBFX_ERR_CONNECTION";
    case RGBFX_ERR_UNKNOWN_EFFECT:
      return "RGBFX_ERR_UNKNOWN_EFFECT";
    case RGBFX_ERR_UNKNOWN_OPTION:
      return "RGBFX_ERR_UNKNOWN_OPTION";
    case RGBFX_ERR_UNKNOWN_DEVICE:
      return "RGBFX_ERR_UNKNOWN_DEVICE";
    case RGBFX_ERR_INVALID_COLOR:
      return "RGBFX_ERR_INVALID_COLOR";
    case RGBFX_ERR_INVALID_BRIGHTNESS:
      return "RGBFX_ERR_INVALID_BRIGHTNESS";
    case RGBFX_ERR_INVALID_VALUE:
      return "RGBFX_ERR_INVALID_VALUE";
    case RGBFX_ERR_DUPLICATE_EFFECT:
      return "RGBFX_ERR_DUPLICATE_EFFECT";
    case RGBFX_ERR_SINK_DISCONNECTED:
      return "RGBFX_ERR_SINK_DISCONNECTED";
    default:
      return esp_err_to_name(err);
  }
}
