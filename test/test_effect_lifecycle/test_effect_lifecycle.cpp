#include <unity.h>

#include "rgbfx/effect_lifecycle.hpp"
#include "rgbfx/errors.hpp"
#include "fakes.hpp"
#include "esp_timer.h"
#include <chrono>
#include <memory>
#include <thread>

namespace {

struct Counters {
  int starts{0};
  int loops{0};
  int stops{0};
  bool stop_seen_in_teardown{false};
};

// Pushes red every iteration and reports hook calls.
class ProbeEffect : public Effect {
 public:
  explicit ProbeEffect(Counters& counters, esp_err_t start_result = ESP_OK, int finish_after = 0)
      : counters_(counters), start_result_(start_result), finish_after_(finish_after) {}

  esp_err_t start(EffectContext&) override {
    ++counters_.starts;
    return start_result_;
  }
  esp_err_t loop(EffectContext& ctx) override {
    ++counters_.loops;
    if (finish_after_ > 0 && counters_.loops >= finish_after_) {
      ctx.finish();
    }
    return ctx.set_targets_color(Rgb8{255, 0, 0});
  }
  void stop(EffectContext& ctx) override {
    ++counters_.stops;
    counters_.stop_seen_in_teardown = ctx.stop_requested();
    ctx.turn_off_targets();
  }

 private:
  Counters& counters_;
  esp_err_t start_result_;
  int finish_after_;
};

// Records elapsed_s() and asks for a custom delay.
class DelayEffect : public Effect {
 public:
  explicit DelayEffect(std::vector<float>& seen) : seen_(seen) {}
  esp_err_t start(EffectContext&) override { return ESP_OK; }
  esp_err_t loop(EffectContext& ctx) override {
    seen_.push_back(ctx.elapsed_s());
    ctx.set_next_delay_ms(5);
    return ESP_OK;
  }
  void stop(EffectContext&) override {}

 private:
  std::vector<float>& seen_;
};

EffectOptions make_options(const OptionOverrides& overrides = {}) {
  EffectOptions opts;
  TEST_ASSERT_EQUAL(ESP_OK, options_merge(base_option_fields(0.001f), overrides, opts));
  return opts;
}

}  // namespace

static FakeSink* sink = nullptr;
static Counters counters;

void setUp() {
  sink = new FakeSink(3);
  sink->connect();
  counters = Counters{};
}

void tearDown() {
  delete sink;
  sink = nullptr;
}

void test_run_walks_states_and_tears_down_once() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_TRUE(lc.state() == LifecycleState::Created);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(4));
  TEST_ASSERT_TRUE(lc.state() == LifecycleState::Stopped);
  TEST_ASSERT_EQUAL(1, counters.starts);
  TEST_ASSERT_EQUAL(4, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
  TEST_ASSERT_EQUAL(4, lc.iterations());
  // 4 iterations x 3 devices + teardown black on 3 devices
  TEST_ASSERT_EQUAL(15, sink->pushes().size());
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, lc.run(1));
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_stop_before_first_iteration_still_tears_down_once() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.start());
  TEST_ASSERT_TRUE(lc.state() == LifecycleState::Running);
  lc.request_stop();
  lc.request_stop();
  TEST_ASSERT_EQUAL(ESP_OK, lc.run());
  TEST_ASSERT_EQUAL(0, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_hooks_observe_stop_request() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.start());
  lc.request_stop();
  TEST_ASSERT_EQUAL(ESP_OK, lc.run());
  TEST_ASSERT_EQUAL(0, counters.loops);
  TEST_ASSERT_TRUE(counters.stop_seen_in_teardown);
}

void test_bounded_run_is_not_a_stop_request() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(2));
  TEST_ASSERT_EQUAL(1, counters.stops);
  TEST_ASSERT_FALSE(counters.stop_seen_in_teardown);
}

void test_destructor_tears_down_started_effect() {
  {
    EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
    TEST_ASSERT_EQUAL(ESP_OK, lc.start());
  }
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_destructor_skips_teardown_when_never_started() {
  {
    EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  }
  TEST_ASSERT_EQUAL(0, counters.starts);
  TEST_ASSERT_EQUAL(0, counters.stops);
}

void test_setup_failure_tears_down_and_returns_error() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters, RGBFX_ERR_INVALID_VALUE), make_options(),
                     *sink);
  TEST_ASSERT_EQUAL(RGBFX_ERR_INVALID_VALUE, lc.run());
  TEST_ASSERT_TRUE(lc.state() == LifecycleState::Stopped);
  TEST_ASSERT_EQUAL(0, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_effect_can_finish_itself() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters, ESP_OK, 3), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run());
  TEST_ASSERT_EQUAL(3, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_sink_disconnect_is_fatal() {
  sink->disconnect_after(4);  // second iteration hits the lost server
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_EQUAL(RGBFX_ERR_SINK_DISCONNECTED, lc.run(100));
  TEST_ASSERT_EQUAL(2, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
  TEST_ASSERT_TRUE(lc.state() == LifecycleState::Stopped);
}

void test_transient_push_failure_keeps_running() {
  sink->fail_device(1);
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(5));
  TEST_ASSERT_EQUAL(5, counters.loops);
  TEST_ASSERT_EQUAL(5, sink->colors_for(0).size() - 1);
  TEST_ASSERT_EQUAL(0, sink->colors_for(1).size());
}

void test_invalid_device_dropped_run_continues() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options({{"devices", "[0,5]"}}),
                     *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(2));
  TEST_ASSERT_EQUAL(3, sink->colors_for(0).size());
  TEST_ASSERT_EQUAL(0, sink->colors_for(1).size());
  TEST_ASSERT_EQUAL(0, sink->colors_for(2).size());
}

void test_brightness_applied_to_pushes() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options({{"max_brightness", "0.5"}}),
                     *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(1));
  const auto colors = sink->colors_for(0);
  TEST_ASSERT_EQUAL_UINT8(127, colors[0].r);
}

void test_elapsed_follows_scheduled_delays() {
  std::vector<float> seen;
  EffectLifecycle lc("delay", std::make_unique<DelayEffect>(seen), make_options(), *sink);
  TEST_ASSERT_EQUAL(ESP_OK, lc.run(4));
  TEST_ASSERT_EQUAL(4, seen.size());
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, seen[0]);
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.005f, seen[1]);
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.015f, seen[3]);
}

void test_stop_from_other_thread_interrupts_long_wait() {
  EffectLifecycle lc("probe", std::make_unique<ProbeEffect>(counters), make_options({{"sleep_s", "30"}}), *sink);
  std::thread stopper([&lc] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    lc.request_stop();
  });
  const int64_t started = esp_timer_get_time();
  TEST_ASSERT_EQUAL(ESP_OK, lc.run());
  const int64_t took_ms = (esp_timer_get_time() - started) / 1000;
  stopper.join();
  TEST_ASSERT_TRUE(took_ms < 2000);
  TEST_ASSERT_EQUAL(1, counters.loops);
  TEST_ASSERT_EQUAL(1, counters.stops);
}

void test_state_names() {
  TEST_ASSERT_EQUAL_STRING("created", lifecycle_state_name(LifecycleState::Created));
  TEST_ASSERT_EQUAL_STRING("stopping", lifecycle_state_name(LifecycleState::Stopping));
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_run_walks_states_and_tears_down_once);
  RUN_TEST(test_stop_before_first_iteration_still_tears_down_once);
  RUN_TEST(test_hooks_observe_stop_request);
  RUN_TEST(test_bounded_run_is_not_a_stop_request);
  RUN_TEST(test_destructor_tears_down_started_effect);
  RUN_TEST(test_destructor_skips_teardown_when_never_started);
  RUN_TEST(test_setup_failure_tears_down_and_returns_error);
  RUN_TEST(test_effect_can_finish_itself);
  RUN_TEST(test_sink_disconnect_is_fatal);
  RUN_TEST(test_transient_push_failure_keeps_running);
  RUN_TEST(test_invalid_device_dropped_run_continues);
  RUN_TEST(test_brightness_applied_to_pushes);
  RUN_TEST(test_elapsed_follows_scheduled_delays);
  RUN_TEST(test_stop_from_other_thread_interrupts_long_wait);
  RUN_TEST(test_state_names);
  return UNITY_END();
}
