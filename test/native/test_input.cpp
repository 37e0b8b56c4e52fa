#ifdef UNIT_TEST

#include <unity.h>

#include "config.h"
#include "controller.h"
#include "fakes.h"
#include "inputter.h"

using namespace fog;
using fog::test::at;

namespace {
TimePoint now;
std::unique_ptr<Config> cfg;
std::unique_ptr<Controller> ctrl;
std::unique_ptr<InputMonitor> monitor;
test::FakeLine* line = nullptr; // owned by monitor

void make() {
  auto l = std::make_unique<test::FakeLine>();
  line = l.get();
  monitor = std::make_unique<InputMonitor>(*ctrl, std::move(l));
}

// polls every 50ms from t0 up to (not incl) t1, with the line at level
void hold(int level, double t0, double t1) {
  line->level = level;
  for(double t = t0; t < t1 - 1e-9; t += 0.05) {
    now = at(t);
    monitor->step(now);
  }
}
}

void setUp() {
  now = at(0);
  cfg = std::make_unique<Config>();
  ctrl = std::make_unique<Controller>(*cfg, nullptr, [] { return now; });
  make();
}
void tearDown() {
  monitor.reset();
  ctrl.reset();
  cfg.reset();
}

void test_closure_fires_trigger() {
  hold(1, 0, 0.2);
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reading);
  TEST_ASSERT(monitor->contact() == ContactState::Open);
  hold(0, 0.2, 0.4);
  TEST_ASSERT(monitor->contact() == ContactState::Closed);
  TEST_ASSERT_EQUAL(1, monitor->triggerCount());
  TEST_ASSERT_TRUE(ctrl->armed());
  TEST_ASSERT(ctrl->active() == ActiveLabel::B);
}

void test_held_closed_fires_once() {
  hold(1, 0, 0.1);
  hold(0, 0.1, 5);
  TEST_ASSERT_EQUAL(1, monitor->triggerCount());
}

void test_closed_at_startup_is_not_an_edge() {
  hold(0, 0, 1);
  TEST_ASSERT_EQUAL(0, monitor->triggerCount());
  hold(1, 1, 1.5);
  hold(0, 1.5, 2);
  TEST_ASSERT_EQUAL(1, monitor->triggerCount());
}

void test_closures_within_debounce_count_once() {
  hold(1, 0, 0.1);
  hold(0, 0.1, 0.2);  // accepted at 0.1
  hold(1, 0.2, 0.3);
  hold(0, 0.3, 0.4);  // 200ms later, bounce
  hold(1, 0.4, 1);
  TEST_ASSERT_EQUAL(1, monitor->triggerCount());
}

void test_closures_400ms_apart_count_twice() {
  hold(1, 0, 0.1);
  hold(0, 0.1, 0.3);  // accepted at 0.1
  hold(1, 0.3, 0.5);
  hold(0, 0.5, 0.7);  // 400ms later
  TEST_ASSERT_EQUAL(2, monitor->triggerCount());
}

void test_read_failures_retry_then_reinit() {
  hold(1, 0, 0.1);
  line->script = {std::nullopt, std::nullopt};
  monitor->step(at(0.1));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Retrying);
  TEST_ASSERT_EQUAL(1, monitor->retries());
  monitor->step(at(0.5)); // retry not due yet
  TEST_ASSERT_EQUAL(1, monitor->retries());
  monitor->step(at(1.1));
  TEST_ASSERT_EQUAL(2, monitor->retries());
  monitor->step(at(2.1)); // script empty, read ok
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reading);
  TEST_ASSERT_EQUAL(0, monitor->retries());
  TEST_ASSERT_EQUAL(1, line->opens);

  line->script = {std::nullopt, std::nullopt, std::nullopt};
  monitor->step(at(3));
  monitor->step(at(4));
  monitor->step(at(5));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reinitializing);
  TEST_ASSERT_EQUAL(1, line->closes);
  TEST_ASSERT(monitor->contact() == ContactState::Unknown);
  monitor->step(at(5.05));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reading);
  TEST_ASSERT_EQUAL(2, line->opens);
}

void test_reinit_retries_every_five_seconds() {
  line->openFailuresLeft = 2;
  monitor->step(at(0));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reinitializing);
  TEST_ASSERT_TRUE(monitor->available());
  monitor->step(at(4.9));
  TEST_ASSERT_EQUAL(0, line->opens);
  monitor->step(at(5)); // second failure
  monitor->step(at(9.9));
  TEST_ASSERT_EQUAL(0, line->opens);
  monitor->step(at(10));
  TEST_ASSERT_EQUAL(1, line->opens);
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reading);
}

void test_no_edge_across_reinit() {
  hold(1, 0, 0.1);
  line->script = {std::nullopt, std::nullopt, std::nullopt};
  monitor->step(at(0.1));
  monitor->step(at(1.1));
  monitor->step(at(2.1));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Reinitializing);
  hold(0, 2.15, 3); // first read after reinit is closed, that's not a closure we saw
  TEST_ASSERT_EQUAL(0, monitor->triggerCount());
}

void test_unavailable_is_permanent() {
  line->present = false;
  monitor->step(at(0));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Unavailable);
  TEST_ASSERT_FALSE(monitor->available());
  TEST_ASSERT(monitor->contact() == ContactState::Unavailable);
  line->present = true;
  monitor->step(at(100));
  TEST_ASSERT(monitor->state() == InputMonitor::State::Unavailable);
  TEST_ASSERT_EQUAL(0, line->opens);

  ctrl->fireTrigger(); // everything else still works
  TEST_ASSERT_TRUE(ctrl->armed());
}

void test_contact_state_names() {
  TEST_ASSERT_EQUAL_STRING("open", toString(ContactState::Open).c_str());
  TEST_ASSERT_EQUAL_STRING("closed", toString(ContactState::Closed).c_str());
  TEST_ASSERT_EQUAL_STRING("unknown", toString(ContactState::Unknown).c_str());
  TEST_ASSERT_EQUAL_STRING("unavailable", toString(ContactState::Unavailable).c_str());
}

int main(int argc, char **argv) {
  UNITY_BEGIN();

  RUN_TEST(test_closure_fires_trigger);
  RUN_TEST(test_held_closed_fires_once);
  RUN_TEST(test_closed_at_startup_is_not_an_edge);
  RUN_TEST(test_closures_within_debounce_count_once);
  RUN_TEST(test_closures_400ms_apart_count_twice);
  RUN_TEST(test_read_failures_retry_then_reinit);
  RUN_TEST(test_reinit_retries_every_five_seconds);
  RUN_TEST(test_no_edge_across_reinit);
  RUN_TEST(test_unavailable_is_permanent);
  RUN_TEST(test_contact_state_names);

  return UNITY_END();
}

#endif
