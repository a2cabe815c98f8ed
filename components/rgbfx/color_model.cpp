#include "rgbfx/color_model.hpp"
#include "rgbfx/errors.hpp"
#include "text_util.hpp"
#include "esp_log.h"
#include "esp_random.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

static const char* TAG = "rgbfx-color";

namespace {

struct NamedColor {
  const char* name;
  Rgb8 color;
};

// Keys are lowercase with separators removed.
const NamedColor kPalette[] = {
    {"red", colors::kRed},
    {"orange", colors::kOrange},
    {"yellow", colors::kYellow},
    {"green", colors::kGreen},
    {"blue", colors::kBlue},
    {"indigo", colors::kIndigo},
    {"violet", colors::kViolet},
    {"white", colors::kWhite},
    {"black", colors::kBlack},
    {"cyan", {0, 255, 255}},
    {"magenta", {255, 0, 255}},
    {"pink", {255, 192, 203}},
    {"brown", {165, 42, 42}},
    {"gray", {128, 128, 128}},
    {"lightgray", {211, 211, 211}},
    {"darkgray", {169, 169, 169}},
    {"lightblue", {173, 216, 230}},
};

const Rgb8 kRainbow[] = {
    colors::kRed, colors::kOrange, colors::kYellow, colors::kGreen,
    colors::kBlue, colors::kIndigo, colors::kViolet,
};

std::string normalize_name(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    if (ch == ' ' || ch == '_' || ch == '-') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

int from_hex(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
  if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
  return -1;
}

bool parse_hex(const std::string& text, Rgb8& out) {
  if (text.size() != 7 || text[0] != '#') {
    return false;
  }
  int nibbles[6];
  for (size_t i = 0; i < 6; ++i) {
    nibbles[i] = from_hex(text[i + 1]);
    if (nibbles[i] < 0) {
      return false;
    }
  }
  out.r = static_cast<uint8_t>((nibbles[0] << 4) + nibbles[1]);
  out.g = static_cast<uint8_t>((nibbles[2] << 4) + nibbles[3]);
  out.b = static_cast<uint8_t>((nibbles[4] << 4) + nibbles[5]);
  return true;
}

bool parse_triple(const std::string& text, Rgb8& out) {
  const auto parts = text_util::split_any(text, ",");
  if (parts.size() != 3) {
    return false;
  }
  long channels[3];
  for (size_t i = 0; i < 3; ++i) {
    if (!text_util::parse_long(parts[i], channels[i])) {
      return false;
    }
    channels[i] = std::clamp<long>(channels[i], 0, 255);
  }
  out = Rgb8{static_cast<uint8_t>(channels[0]), static_cast<uint8_t>(channels[1]), static_cast<uint8_t>(channels[2])};
  return true;
}

float random_unit() {
  return static_cast<float>(esp_random()) / static_cast<float>(0xFFFFFFFFu);
}

uint8_t lerp_channel(uint8_t a, uint8_t b, float t) {
  const float v = static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t;
  return static_cast<uint8_t>(std::clamp(static_cast<int>(v), 0, 255));
}

}  // namespace

esp_err_t color_parse(const std::string& text, Rgb8& out, bool* was_random) {
  if (was_random) {
    *was_random = false;
  }
  const std::string t = text_util::trim_copy(text);
  if (t.empty()) {
    return RGBFX_ERR_INVALID_COLOR;
  }
  const std::string key = normalize_name(t);
  if (key == "random") {
    out = random_color();
    if (was_random) {
      *was_random = true;
    }
    return ESP_OK;
  }
  for (const auto& entry : kPalette) {
    if (key == entry.name) {
      out = entry.color;
      return ESP_OK;
    }
  }
  if (t[0] == '#') {
    if (parse_hex(t, out)) {
      return ESP_OK;
    }
    ESP_LOGD(TAG, "Bad hex color '%s'", t.c_str());
    return RGBFX_ERR_INVALID_COLOR;
  }
  if (t.find(',') != std::string::npos && parse_triple(t, out)) {
    return ESP_OK;
  }
  ESP_LOGD(TAG, "Unrecognized color '%s'", t.c_str());
  return RGBFX_ERR_INVALID_COLOR;
}

esp_err_t brightness_parse(const std::string& text, float& out) {
  const std::string t = text_util::lower_copy(text_util::trim_copy(text));
  if (t.empty()) {
    return RGBFX_ERR_INVALID_BRIGHTNESS;
  }
  if (t == "random") {
    out = random_unit();
    return ESP_OK;
  }
  float value = 0.0f;
  if (t.back() == '%') {
    if (!text_util::parse_float(t.substr(0, t.size() - 1), value) || !std::isfinite(value)) {
      return RGBFX_ERR_INVALID_BRIGHTNESS;
    }
    value /= 100.0f;
  } else if (!text_util::parse_float(t, value) || !std::isfinite(value)) {
    return RGBFX_ERR_INVALID_BRIGHTNESS;
  }
  out = std::clamp(value, 0.0f, 1.0f);
  return ESP_OK;
}

Rgb8 lerp_color(const Rgb8& a, const Rgb8& b, float t) {
  if (!(t > 0.0f)) {
    return a;
  }
  if (t >= 1.0f) {
    return b;
  }
  return Rgb8{lerp_channel(a.r, b.r, t), lerp_channel(a.g, b.g, t), lerp_channel(a.b, b.b, t)};
}

Rgb8 scale_color(const Rgb8& color, float factor) {
  const float f = std::isfinite(factor) ? std::clamp(factor, 0.0f, 1.0f) : 0.0f;
  return Rgb8{static_cast<uint8_t>(color.r * f), static_cast<uint8_t>(color.g * f), static_cast<uint8_t>(color.b * f)};
}

Rgb8 rainbow_color(size_t index) {
  return kRainbow[index % rainbow_size()];
}

size_t rainbow_size() {
  return sizeof(kRainbow) / sizeof(kRainbow[0]);
}

std::vector<Rgb8> palette_colors(bool include_black) {
  std::vector<Rgb8> out;
  for (const auto& entry : kPalette) {
    if (!include_black && entry.color == colors::kBlack) {
      continue;
    }
    out.push_back(entry.color);
  }
  return out;
}

Rgb8 random_palette_color() {
  const auto choices = palette_colors(false);
  return choices[esp_random() % choices.size()];
}

Rgb8 random_color() {
  const uint32_t bits = esp_random();
  return Rgb8{static_cast<uint8_t>(bits & 0xFF), static_cast<uint8_t>((bits >> 8) & 0xFF),
              static_cast<uint8_t>((bits >> 16) & 0xFF)};
}

std::string color_to_hex(const Rgb8& color) {
  char buf[8];
  snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
  return buf;
}
