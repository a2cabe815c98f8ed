#include <unity.h>

#include "rgbfx/color_model.hpp"
#include "rgbfx/effect_lifecycle.hpp"
#include "rgbfx/errors.hpp"
#include "rgbfx_effects.hpp"
#include "rgbfx_effects/screen_sampling.hpp"
#include "fakes.hpp"
#include <memory>

static FakeSink* sink = nullptr;
static FakeAudioSource* audio = nullptr;
static FakeScreenSource* screen = nullptr;

static esp_err_t run_fx(const EffectDescriptor& desc, const OptionOverrides& overrides, uint32_t iterations) {
  EffectOptions opts;
  esp_err_t err = options_merge(desc.schema, overrides, opts);
  TEST_ASSERT_EQUAL(ESP_OK, err);
  CaptureSources captures{};
  captures.audio = audio;
  captures.screen = screen;
  EffectLifecycle lc(desc.name, desc.factory(), opts, *sink, captures);
  return lc.run(iterations);
}

static void assert_rgb(const Rgb8& expected, const Rgb8& actual) {
  TEST_ASSERT_EQUAL_UINT8(expected.r, actual.r);
  TEST_ASSERT_EQUAL_UINT8(expected.g, actual.g);
  TEST_ASSERT_EQUAL_UINT8(expected.b, actual.b);
}

void setUp() {
  sink = new FakeSink(3);
  sink->connect();
  audio = new FakeAudioSource();
  screen = new FakeScreenSource();
}

void tearDown() {
  delete sink;
  delete audio;
  delete screen;
}

void test_static_green_at_half_brightness() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(static_effect(), {{"color", "#00FF00"}, {"max_brightness", "50%"},
                                                     {"sleep_s", "0.001"}}, 3));
  for (uint16_t dev = 0; dev < 3; ++dev) {
    const auto colors = sink->colors_for(dev);
    TEST_ASSERT_EQUAL(4, colors.size());
    for (size_t i = 0; i < 3; ++i) {
      assert_rgb(Rgb8{0, 127, 0}, colors[i]);
    }
    assert_rgb(colors::kBlack, colors[3]);
  }
}

void test_static_keep_on_stop_leaves_color() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(static_effect(), {{"color", "blue"}, {"keep_on_stop", "true"}}, 1));
  const auto colors = sink->colors_for(0);
  TEST_ASSERT_EQUAL(1, colors.size());
  assert_rgb(colors::kBlue, colors[0]);
}

void test_breathing_one_cycle_has_single_minimum() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(breathing_effect(), {{"breathing_speed", "1.0"}, {"sleep_s", "0.05"},
                                                        {"min_brightness", "0.1"}}, 21));
  auto trace = sink->colors_for(0);
  TEST_ASSERT_EQUAL(22, trace.size());
  trace.pop_back();  // teardown
  TEST_ASSERT_TRUE(trace.front().r >= 254);
  TEST_ASSERT_TRUE(trace.back().r >= 254);
  size_t min_index = 0;
  for (size_t i = 1; i < trace.size(); ++i) {
    if (trace[i].r < trace[min_index].r) {
      min_index = i;
    }
  }
  TEST_ASSERT_EQUAL(10, min_index);
  TEST_ASSERT_INT_WITHIN(1, 25, trace[min_index].r);
  for (size_t i = 1; i <= min_index; ++i) {
    TEST_ASSERT_TRUE(trace[i].r <= trace[i - 1].r);
  }
  for (size_t i = min_index + 1; i < trace.size(); ++i) {
    TEST_ASSERT_TRUE(trace[i].r >= trace[i - 1].r);
  }
}

void test_rainbow_discrete_steps_through_sequence() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(rainbow_effect(), {{"smooth_transition", "false"}, {"sleep_s", "0.001"}}, 8));
  const auto colors = sink->colors_for(1);
  TEST_ASSERT_EQUAL(9, colors.size());
  for (size_t i = 0; i < 8; ++i) {
    assert_rgb(rainbow_color(i), colors[i]);
  }
}

void test_rainbow_smooth_blends_neighbours() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(rainbow_effect(), {{"steps_per_color", "2"}, {"transition_delay", "0"}}, 3));
  const auto colors = sink->colors_for(0);
  assert_rgb(colors::kRed, colors[0]);
  assert_rgb(lerp_color(colors::kRed, colors::kOrange, 0.5f), colors[1]);
  assert_rgb(colors::kOrange, colors[2]);
}

void test_random_colors_draw_from_palette() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(random_colors_effect(), {{"color_palette", "red;blue"}, {"sleep_s", "0.001"}}, 6));
  const auto pushes = sink->pushes();
  TEST_ASSERT_EQUAL(21, pushes.size());
  for (size_t i = 0; i < 18; ++i) {
    TEST_ASSERT_TRUE(pushes[i].color == colors::kRed || pushes[i].color == colors::kBlue);
  }
}

void test_police_lights_sequence() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(police_lights_effect(), {{"flash_duration_ms", "1"}, {"pause_duration_s", "0"}}, 8));
  const auto colors = sink->colors_for(2);
  const Rgb8 expected[] = {colors::kBlue, colors::kBlack, colors::kBlue, colors::kBlack,
                           colors::kRed,  colors::kBlack, colors::kRed,  colors::kBlack};
  TEST_ASSERT_EQUAL(9, colors.size());
  for (size_t i = 0; i < 8; ++i) {
    assert_rgb(expected[i], colors[i]);
  }
}

void test_lightning_rejects_inverted_fade_range() {
  TEST_ASSERT_EQUAL(RGBFX_ERR_INVALID_VALUE,
                    run_fx(lightning_effect(), {{"fade_min_ms", "200"}, {"fade_max_ms", "100"}}, 3));
}

void test_lightning_flashes_raw_then_fades() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(lightning_effect(), {{"color", "red"}, {"target_mode", "all"},
                                                        {"max_brightness", "0.5"}, {"fade_min_ms", "30"},
                                                        {"fade_max_ms", "30"}, {"flash_duration_ms", "1"}}, 4));
  const auto colors = sink->colors_for(0);
  TEST_ASSERT_EQUAL(5, colors.size());
  assert_rgb(colors::kRed, colors[0]);  // no brightness on the flash itself
  TEST_ASSERT_TRUE(colors[1].r <= 128 && colors[1].r > colors[2].r);
  TEST_ASSERT_TRUE(colors[2].r > 0);
  assert_rgb(colors::kBlack, colors[3]);
}

void test_lightning_random_mode_strikes_one_device() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(lightning_effect(), {{"fade_min_ms", "10"}, {"fade_max_ms", "10"},
                                                        {"flash_duration_ms", "1"}}, 1));
  // one flash plus teardown on every device
  TEST_ASSERT_EQUAL(4, sink->pushes().size());
}

void test_audio_needs_a_source() {
  delete audio;
  audio = nullptr;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, run_fx(audio_effect(), {}, 1));
}

void test_audio_peak_flashes_and_timeouts_skip() {
  audio->push_frame(std::vector<float>(256, 0.5f));
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(audio_effect(), {{"sleep_s", "0.001"}, {"chunk_size", "256"}}, 3));
  TEST_ASSERT_EQUAL(1, audio->opens_);
  TEST_ASSERT_EQUAL(1, audio->closes_);
  TEST_ASSERT_FALSE(audio->loopback_);
  TEST_ASSERT_EQUAL(44100, audio->sample_rate_);
  TEST_ASSERT_EQUAL(256, audio->last_request_);
  const auto colors = sink->colors_for(0);
  TEST_ASSERT_EQUAL(2, colors.size());
  TEST_ASSERT_TRUE(colors[0] != colors::kBlack);
  assert_rgb(colors::kBlack, colors[1]);
}

void test_audio_loopback_holds_color_on_silence() {
  audio->push_frame(make_sine(1000.0f, 44100, 1024));
  audio->push_frame(std::vector<float>(1024, 0.0f));
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(audio_loopback_effect(), {{"sleep_s", "0.001"}}, 3));
  TEST_ASSERT_TRUE(audio->loopback_);
  const auto colors = sink->colors_for(0);
  TEST_ASSERT_EQUAL(3, colors.size());
  TEST_ASSERT_TRUE(colors[0].r > 200 && colors[0].g > 200);
  assert_rgb(colors[0], colors[1]);
  assert_rgb(colors::kBlack, colors[2]);
}

void test_audio_loopback_per_device_windows() {
  std::vector<float> frame = make_sine(1000.0f, 44100, 512);
  const std::vector<float> high = make_sine(5500.0f, 44100, 512);
  frame.insert(frame.end(), high.begin(), high.end());
  audio->push_frame(frame);
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(audio_loopback_effect(), {{"per_device", "true"}, {"devices", "[0,1]"}}, 1));
  const auto first = sink->colors_for(0);
  const auto second = sink->colors_for(1);
  TEST_ASSERT_TRUE(first[0].r > 200 && first[0].b < 60);
  TEST_ASSERT_TRUE(second[0].b > 200 && second[0].r < 60);
  TEST_ASSERT_EQUAL(0, sink->colors_for(2).size());
}

void test_audio_loopback_rejects_bad_bands() {
  TEST_ASSERT_EQUAL(RGBFX_ERR_INVALID_VALUE, run_fx(audio_loopback_effect(), {{"frequency_bands", "[500,100]"}}, 1));
  TEST_ASSERT_EQUAL(0, audio->opens_);
}

void test_desktop_average_without_smoothing() {
  screen->push_solid(4, 4, Rgb8{10, 200, 30});
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(desktop_effect(), {{"color_sampling", "average"},
                                                      {"smooth_transitions", "false"}}, 1));
  assert_rgb(Rgb8{10, 200, 30}, sink->colors_for(0)[0]);
}

void test_desktop_without_frame_holds_color() {
  TEST_ASSERT_EQUAL(ESP_OK, run_fx(desktop_effect(), {{"smooth_transitions", "false"}}, 1));
  TEST_ASSERT_EQUAL(1, screen->captures_);
  assert_rgb(colors::kBlack, sink->colors_for(0)[0]);
}

void test_dominant_sampling_quantises() {
  ScreenFrame frame{};
  frame.width = 4;
  frame.height = 4;
  frame.pixels.assign(10, Rgb8{100, 100, 100});
  frame.pixels.insert(frame.pixels.end(), 6, Rgb8{250, 0, 0});
  assert_rgb(Rgb8{90, 90, 90}, sample_dominant_color(frame, 30));
  assert_rgb(Rgb8{100, 100, 100}, sample_dominant_color(frame, 0));
  assert_rgb(Rgb8{156, 62, 62}, sample_average_color(frame));
  assert_rgb(colors::kBlack, sample_dominant_color(ScreenFrame{}, 30));
}

void test_loopback_smoothing_below_one() {
  const EffectDescriptor desc = audio_loopback_effect();
  EffectOptions opts;
  TEST_ASSERT_EQUAL(RGBFX_ERR_INVALID_VALUE, options_merge(desc.schema, {{"smoothing", "1.0"}}, opts));
  TEST_ASSERT_EQUAL(ESP_OK, options_merge(desc.schema, {{"smoothing", "0.95"}}, opts));
}

// Start every built-in, stop before the first tick: one teardown, devices left dark.
void test_every_builtin_stops_cleanly_right_after_start() {
  for (const EffectDescriptor& desc : builtin_effects()) {
    FakeSink devices(3);
    devices.connect();
    FakeAudioSource mic;
    FakeScreenSource display;
    CaptureSources captures{};
    captures.audio = &mic;
    captures.screen = &display;

    EffectOptions opts;
    TEST_ASSERT_EQUAL_MESSAGE(ESP_OK, options_merge(desc.schema, {}, opts), desc.name.c_str());
    EffectLifecycle lc(desc.name, desc.factory(), opts, devices, captures);
    TEST_ASSERT_EQUAL_MESSAGE(ESP_OK, lc.start(), desc.name.c_str());
    lc.request_stop();
    TEST_ASSERT_EQUAL_MESSAGE(ESP_OK, lc.run(), desc.name.c_str());
    TEST_ASSERT_TRUE_MESSAGE(lc.state() == LifecycleState::Stopped, desc.name.c_str());
    TEST_ASSERT_EQUAL_MESSAGE(0, lc.iterations(), desc.name.c_str());

    for (uint16_t dev = 0; dev < 3; ++dev) {
      const auto pushed = devices.colors_for(dev);
      TEST_ASSERT_FALSE_MESSAGE(pushed.empty(), desc.name.c_str());
      TEST_ASSERT_TRUE_MESSAGE(pushed.back() == colors::kBlack, desc.name.c_str());
    }
    if (desc.name == "Audio" || desc.name == "AudioLoopback") {
      TEST_ASSERT_EQUAL_MESSAGE(1, mic.opens_, desc.name.c_str());
      TEST_ASSERT_EQUAL_MESSAGE(1, mic.closes_, desc.name.c_str());
    } else {
      TEST_ASSERT_EQUAL_MESSAGE(0, mic.closes_, desc.name.c_str());
    }
  }
}

void test_keep_on_stop_effects_push_nothing_when_stopped_right_away() {
  for (const EffectDescriptor& desc : {static_effect(), breathing_effect()}) {
    FakeSink devices(2);
    devices.connect();
    EffectOptions opts;
    TEST_ASSERT_EQUAL(ESP_OK, options_merge(desc.schema, {{"keep_on_stop", "true"}}, opts));
    EffectLifecycle lc(desc.name, desc.factory(), opts, devices);
    TEST_ASSERT_EQUAL(ESP_OK, lc.start());
    lc.request_stop();
    TEST_ASSERT_EQUAL(ESP_OK, lc.run());
    TEST_ASSERT_TRUE(lc.state() == LifecycleState::Stopped);
    TEST_ASSERT_EQUAL_MESSAGE(0, devices.pushes().size(), desc.name.c_str());
  }
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_static_green_at_half_brightness);
  RUN_TEST(test_static_keep_on_stop_leaves_color);
  RUN_TEST(test_breathing_one_cycle_has_single_minimum);
  RUN_TEST(test_rainbow_discrete_steps_through_sequence);
  RUN_TEST(test_rainbow_smooth_blends_neighbours);
  RUN_TEST(test_random_colors_draw_from_palette);
  RUN_TEST(test_police_lights_sequence);
  RUN_TEST(test_lightning_rejects_inverted_fade_range);
  RUN_TEST(test_lightning_flashes_raw_then_fades);
  RUN_TEST(test_lightning_random_mode_strikes_one_device);
  RUN_TEST(test_audio_needs_a_source);
  RUN_TEST(test_audio_peak_flashes_and_timeouts_skip);
  RUN_TEST(test_audio_loopback_holds_color_on_silence);
  RUN_TEST(test_audio_loopback_per_device_windows);
  RUN_TEST(test_audio_loopback_rejects_bad_bands);
  RUN_TEST(test_desktop_average_without_smoothing);
  RUN_TEST(test_desktop_without_frame_holds_color);
  RUN_TEST(test_dominant_sampling_quantises);
  RUN_TEST(test_loopback_smoothing_below_one);
  RUN_TEST(test_every_builtin_stops_cleanly_right_after_start);
  RUN_TEST(test_keep_on_stop_effects_push_nothing_when_stopped_right_away);
  return UNITY_END();
}
