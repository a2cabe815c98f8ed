#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct Rgb8 {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
};

inline bool operator==(const Rgb8& a, const Rgb8& b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Rgb8& a, const Rgb8& b) {
  return !(a == b);
}

struct DeviceInfo {
  uint16_t index{0};
  std::string name{};
  std::string type{};
  uint16_t led_count{0};
};

// Empty or all -> every device the sink reports.
struct DeviceSelector {
  bool all{true};
  std::vector<int> indices{};
};

struct FrequencyBand {
  float low_hz{0.0f};
  float high_hz{0.0f};
  Rgb8 color{};
};

struct ScreenFrame {
  uint16_t width{0};
  uint16_t height{0};
  std::vector<Rgb8> pixels{};  // row major
};

enum class LifecycleState {
  Created,
  Running,
  Stopping,
  Stopped,
};
