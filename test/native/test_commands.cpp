#ifdef UNIT_TEST

#include <unity.h>

#include "app.h"
#include "fakes.h"

using namespace fog;
using fog::test::at;

namespace {
TimePoint now;
std::unique_ptr<Config> cfg;
std::unique_ptr<test::MemoryStore> store;
std::unique_ptr<Controller> ctrl;
std::unique_ptr<CommandRunner> cmds;

nlohmann::json run(const std::string& line) { return cmds->line(line); }

nlohmann::json fakeStatus() {
  OutputLoop::Status out;
  out.connected = true;
  out.alive = true;
  return statusJson(ctrl->status(), out, ContactState::Open, true);
}
}

void setUp() {
  now = at(0);
  cfg = std::make_unique<Config>();
  store = std::make_unique<test::MemoryStore>();
  ctrl = std::make_unique<Controller>(*cfg, store.get(), [] { return now; });
  ctrl->load();
  cmds = std::make_unique<CommandRunner>();
  addCommands(*cmds, *ctrl, *cfg, fakeStatus);
}
void tearDown() {
  cmds.reset();
  ctrl.reset();
  store.reset();
  cfg.reset();
}

void test_status_document() {
  auto s = run("status");
  for(auto key: {"active_scene", "transport_connected", "transport_error", "armed", "remaining_seconds",
                 "previous_scene", "contact_state", "input_available", "output_alive",
                 "trigger_duration", "channels"})
    TEST_ASSERT_TRUE_MESSAGE(s.contains(key), key);
  TEST_ASSERT_EQUAL_STRING("a", s["active_scene"].get<std::string>().c_str());
  TEST_ASSERT_TRUE(s["transport_error"].is_null());
  TEST_ASSERT_TRUE(s["previous_scene"].is_null());
  TEST_ASSERT_EQUAL_STRING("open", s["contact_state"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL(100, s["channels"]["safety"].get<int>());
}

void test_trigger_shows_in_status() {
  run("scene c");
  run("trigger");
  now = at(2.5);
  auto s = run("status");
  TEST_ASSERT_TRUE(s["armed"].get<bool>());
  TEST_ASSERT_EQUAL_STRING("b", s["active_scene"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("c", s["previous_scene"].get<std::string>().c_str());
  TEST_ASSERT_DOUBLE_WITHIN(0.01, 7.5, s["remaining_seconds"].get<double>());
}

void test_channel_and_blackout() {
  auto r = run("channel 1 200");
  TEST_ASSERT_TRUE(r["ok"].get<bool>());
  TEST_ASSERT_EQUAL_STRING("custom", run("status")["active_scene"].get<std::string>().c_str());
  run("blackout");
  auto s = run("status");
  TEST_ASSERT_EQUAL_STRING("none", s["active_scene"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL(0, s["channels"]["fog"].get<int>());
}

void test_errors_come_back_as_json() {
  auto r = run("channel 16 0");
  TEST_ASSERT_EQUAL_STRING("SafetyViolation", r["code"].get<std::string>().c_str());
  r = run("channel 600 1");
  TEST_ASSERT_EQUAL_STRING("OutOfRange", r["code"].get<std::string>().c_str());
  r = run("scene z");
  TEST_ASSERT_EQUAL_STRING("UnknownScene", r["code"].get<std::string>().c_str());
  r = run("channel one 1");
  TEST_ASSERT_EQUAL_STRING("BadArgument", r["code"].get<std::string>().c_str());
  r = run("scene");
  TEST_ASSERT_EQUAL_STRING("BadArgument", r["code"].get<std::string>().c_str());
  r = run("dance");
  TEST_ASSERT_EQUAL_STRING("UnknownCommand", r["code"].get<std::string>().c_str());
  r = run("duration 1000");
  TEST_ASSERT_EQUAL_STRING("OutOfRange", r["code"].get<std::string>().c_str());
  TEST_ASSERT_TRUE(run("   ").is_null());
}

void test_save_update_and_list() {
  run("channel 1 11");
  run("save d");
  run("update c 1=22 name=Twenty");
  auto scenes = run("scenes");
  TEST_ASSERT_EQUAL(11, scenes["scene_d"]["channels"]["1"].get<int>());
  TEST_ASSERT_EQUAL(22, scenes["scene_c"]["channels"]["1"].get<int>());
  TEST_ASSERT_EQUAL_STRING("Twenty", scenes["scene_c"]["name"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL(2, store->saves);
  auto r = run("update c 16=0");
  TEST_ASSERT_EQUAL_STRING("SafetyViolation", r["code"].get<std::string>().c_str());
}

void test_duration_and_config() {
  TEST_ASSERT_EQUAL_DOUBLE(10, run("duration")["scene_b_duration"].get<double>());
  run("duration 30");
  auto c = run("config");
  TEST_ASSERT_EQUAL_DOUBLE(30, c["scene_b_duration"].get<double>());
  TEST_ASSERT_EQUAL(17, c["contact_pin"].get<int>());
  TEST_ASSERT_EQUAL_DOUBLE(30, store->state.duration);
}

void test_help_lists_everything() {
  auto h = run("HELP");
  for(auto cmd: {"status", "trigger", "scene", "channel", "blackout", "save", "update",
                 "scenes", "config", "duration", "help"})
    TEST_ASSERT_TRUE_MESSAGE(h.contains(cmd), cmd);
}

void test_console_prints_one_line_per_command() {
  std::vector<std::string> printed;
  Console console(*cmds, [&printed](const std::string& s) { printed.push_back(s); });
  console.handle("trigger");
  console.handle("");
  console.handle("scene a");
  TEST_ASSERT_EQUAL(2, printed.size());
  TEST_ASSERT_EQUAL_STRING("{\"ok\":true}", printed[1].c_str());
}

void test_console_survives_bad_input() {
  std::vector<std::string> printed;
  Console console(*cmds, [&printed](const std::string& s) { printed.push_back(s); });
  cmds->add("boom", "throws something odd", [] (auto&) -> nlohmann::json { throw std::runtime_error("odd"); });

  console.handle("scene \xff");
  console.handle("\xfe\xff");
  console.handle("boom");
  console.handle("scene b");
  TEST_ASSERT_EQUAL(4, printed.size());
  TEST_ASSERT_EQUAL_STRING("UnknownScene", nlohmann::json::parse(printed[0])["code"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("UnknownCommand", nlohmann::json::parse(printed[1])["code"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("Internal", nlohmann::json::parse(printed[2])["code"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("{\"ok\":true}", printed[3].c_str());
  TEST_ASSERT_TRUE(ctrl->active() == ActiveLabel::B);
}

void test_update_with_bad_name_is_refused() {
  auto r = run("update c 1=5 name=bad\xff");
  TEST_ASSERT_EQUAL_STRING("OutOfRange", r["code"].get<std::string>().c_str());
  run("save d"); // persistence still works
  TEST_ASSERT_EQUAL(1, store->saves);
}

int main(int argc, char **argv) {
  UNITY_BEGIN();

  RUN_TEST(test_status_document);
  RUN_TEST(test_trigger_shows_in_status);
  RUN_TEST(test_channel_and_blackout);
  RUN_TEST(test_errors_come_back_as_json);
  RUN_TEST(test_save_update_and_list);
  RUN_TEST(test_duration_and_config);
  RUN_TEST(test_help_lists_everything);
  RUN_TEST(test_console_prints_one_line_per_command);
  RUN_TEST(test_console_survives_bad_input);
  RUN_TEST(test_update_with_bad_name_is_refused);

  return UNITY_END();
}

#endif
