#pragma once
#include "rgbfx/capture_source.hpp"
#include "rgbfx/device_sink.hpp"
#include "rgbfx/errors.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct PushRecord {
  uint16_t device{0};
  Rgb8 color{};
};

// Records every push. Thread safe, so task tests can read while an effect runs.
class FakeSink : public DeviceSink {
 public:
  explicit FakeSink(size_t device_count = 3) {
    for (size_t i = 0; i < device_count; ++i) {
      DeviceInfo dev{};
      dev.index = static_cast<uint16_t>(i);
      dev.name = "Device " + std::to_string(i);
      dev.type = "ledstrip";
      dev.led_count = 30;
      devices_.push_back(dev);
    }
  }

  esp_err_t connect() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connect_result_ == ESP_OK) {
      connected_ = true;
    }
    return connect_result_;
  }
  void disconnect() override {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
  }
  bool connected() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }
  std::vector<DeviceInfo> list_devices() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
  }
  esp_err_t set_color(const DeviceInfo& device, const Rgb8& color) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (disconnect_after_ >= 0 && attempts_ > disconnect_after_) {
      connected_ = false;
      return RGBFX_ERR_SINK_DISCONNECTED;
    }
    if (fail_device_ == device.index) {
      return ESP_FAIL;
    }
    pushes_.push_back(PushRecord{device.index, color});
    return ESP_OK;
  }

  void set_connect_result(esp_err_t err) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_result_ = err;
  }
  // Pushes to this device fail transiently.
  void fail_device(int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_device_ = index;
  }
  // Every push after the first count reports a lost server.
  void disconnect_after(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_after_ = count;
  }
  std::vector<PushRecord> pushes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushes_;
  }
  std::vector<Rgb8> colors_for(uint16_t device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Rgb8> out;
    for (const auto& push : pushes_) {
      if (push.device == device) {
        out.push_back(push.color);
      }
    }
    return out;
  }
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pushes_.clear();
    attempts_ = 0;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<DeviceInfo> devices_{};
  std::vector<PushRecord> pushes_{};
  esp_err_t connect_result_{ESP_OK};
  bool connected_{false};
  int fail_device_{-1};
  int disconnect_after_{-1};
  int attempts_{0};
};

// Hands out queued frames, ESP_ERR_TIMEOUT once the queue is empty.
class FakeAudioSource : public AudioCaptureSource {
 public:
  esp_err_t open(uint32_t sample_rate, int device_index, bool loopback) override {
    sample_rate_ = sample_rate;
    device_index_ = device_index;
    loopback_ = loopback;
    ++opens_;
    return open_result_;
  }
  esp_err_t read_frame(size_t sample_count, std::vector<float>& out, uint32_t) override {
    last_request_ = sample_count;
    if (frames_.empty()) {
      return ESP_ERR_TIMEOUT;
    }
    out = frames_.front();
    frames_.pop_front();
    return ESP_OK;
  }
  void close() override { ++closes_; }

  void push_frame(std::vector<float> frame) { frames_.push_back(std::move(frame)); }

  esp_err_t open_result_{ESP_OK};
  uint32_t sample_rate_{0};
  int device_index_{-2};
  bool loopback_{false};
  size_t last_request_{0};
  int opens_{0};
  int closes_{0};

 private:
  std::deque<std::vector<float>> frames_{};
};

class FakeScreenSource : public ScreenCaptureSource {
 public:
  esp_err_t capture_frame(ScreenFrame& out, uint32_t) override {
    ++captures_;
    if (frames_.empty()) {
      return ESP_ERR_TIMEOUT;
    }
    out = frames_.front();
    frames_.pop_front();
    return ESP_OK;
  }

  void push_solid(uint16_t width, uint16_t height, const Rgb8& color) {
    ScreenFrame frame{};
    frame.width = width;
    frame.height = height;
    frame.pixels.assign(static_cast<size_t>(width) * height, color);
    frames_.push_back(frame);
  }

  int captures_{0};

 private:
  std::deque<ScreenFrame> frames_{};
};

// Sine of the given frequency, amplitude in [-1, 1].
std::vector<float> make_sine(float freq_hz, uint32_t sample_rate, size_t count, float amplitude = 0.8f);
