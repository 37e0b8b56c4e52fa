#ifdef UNIT_TEST

#include <unity.h>

#include "fakes.h"
#include "frame.h"
#include "scene.h"

using namespace fog;
using fog::test::expectThrows;

void setUp() {}
void tearDown() {}

void test_new_frame_is_dark_but_listening() {
  ChannelFrame frame;
  TEST_ASSERT_EQUAL(100, frame[kSafetyChannel]);
  for(uint16_t ch = 1; ch <= kUniverseSize; ch++)
    if(ch != kSafetyChannel) TEST_ASSERT_EQUAL(0, frame[ch]);
  TEST_ASSERT_EQUAL(0, frame.data()[0]); // start code
}

void test_set_rejects_out_of_range() {
  ChannelFrame frame;
  expectThrows<ValidationError>([&] { frame.set(0, 10); }, ErrorCode::OutOfRange, "channel 0");
  expectThrows<ValidationError>([&] { frame.set(513, 10); }, ErrorCode::OutOfRange, "channel 513");
  expectThrows<ValidationError>([&] { frame.set(1, 256); }, ErrorCode::OutOfRange, "value 256");
  expectThrows<ValidationError>([&] { frame.set(1, -1); }, ErrorCode::OutOfRange, "value -1");
  TEST_ASSERT_EQUAL(0, frame[1]);
}

void test_set_safety_channel() {
  ChannelFrame frame;
  for(int bad: {0, 49, 201, 255})
    expectThrows<ValidationError>([&] { frame.set(kSafetyChannel, bad); }, ErrorCode::SafetyViolation, "bad safety");
  TEST_ASSERT_EQUAL(100, frame[kSafetyChannel]);

  for(int good: {50, 100, 200}) {
    frame.set(kSafetyChannel, good);
    TEST_ASSERT_EQUAL(good, frame[kSafetyChannel]);
  }
}

void test_set_edges() {
  ChannelFrame frame;
  frame.set(1, 255);
  frame.set(512, 0);
  frame.set(512, 7);
  TEST_ASSERT_EQUAL(255, frame[1]);
  TEST_ASSERT_EQUAL(7, frame[512]);
}

void test_blackout() {
  ChannelFrame frame;
  frame.set(1, 255);
  frame.set(kSafetyChannel, 200);
  frame.set(300, 9);
  frame.blackout();
  TEST_ASSERT_EQUAL(100, frame[kSafetyChannel]);
  for(uint16_t ch = 1; ch <= kUniverseSize; ch++)
    if(ch != kSafetyChannel) TEST_ASSERT_EQUAL(0, frame[ch]);
}

void test_apply_fixes_bad_safety() {
  ChannelFrame frame;
  auto scene = defaultScenes()[index(SceneId::B)];
  scene.at(kSafetyChannel) = 0;
  frame.apply(scene);
  TEST_ASSERT_EQUAL(255, frame[1]);
  TEST_ASSERT_EQUAL(100, frame[kSafetyChannel]);

  scene.at(kSafetyChannel) = 50;
  frame.apply(scene);
  TEST_ASSERT_EQUAL(50, frame[kSafetyChannel]);
}

void test_apply_leaves_upper_channels() {
  ChannelFrame frame;
  frame.set(17, 42);
  frame.apply(defaultScenes()[index(SceneId::C)]);
  TEST_ASSERT_EQUAL(42, frame[17]);
  TEST_ASSERT_EQUAL(50, frame[14]);
}

void test_scene_names() {
  TEST_ASSERT(sceneFromName("a") == SceneId::A);
  TEST_ASSERT(sceneFromName("B") == SceneId::B);
  TEST_ASSERT(sceneFromName("scene_c") == SceneId::C);
  TEST_ASSERT(sceneFromName(" d ") == SceneId::D);
  expectThrows<ValidationError>([] { sceneFromName("e"); }, ErrorCode::UnknownScene, "e");
  expectThrows<ValidationError>([] { sceneFromName(""); }, ErrorCode::UnknownScene, "empty");
  TEST_ASSERT_EQUAL_STRING("scene_b", key(SceneId::B).c_str());
}

void test_default_scenes_are_safe() {
  for(auto& scene: defaultScenes())
    TEST_ASSERT_TRUE(validSafetyValue(scene.safety()));
  auto a = defaultScenes()[index(kIdleScene)];
  for(uint16_t ch = 1; ch < kSafetyChannel; ch++) TEST_ASSERT_EQUAL(0, a.at(ch));
}

void test_named_channels() {
  ChannelFrame frame;
  frame.apply(defaultScenes()[index(SceneId::D)]);
  auto named = namedChannels(frame.data());
  TEST_ASSERT_EQUAL(15, named.size()); // no channel 2
  TEST_ASSERT_EQUAL(200, named["fog"]);
  TEST_ASSERT_EQUAL(255, named["outer_red"]);
  TEST_ASSERT_EQUAL(100, named["auto_color"]);
  TEST_ASSERT_EQUAL(100, named["safety"]);
}

int main(int argc, char **argv) {
  UNITY_BEGIN();

  RUN_TEST(test_new_frame_is_dark_but_listening);
  RUN_TEST(test_set_rejects_out_of_range);
  RUN_TEST(test_set_safety_channel);
  RUN_TEST(test_set_edges);
  RUN_TEST(test_blackout);
  RUN_TEST(test_apply_fixes_bad_safety);
  RUN_TEST(test_apply_leaves_upper_channels);
  RUN_TEST(test_scene_names);
  RUN_TEST(test_default_scenes_are_safe);
  RUN_TEST(test_named_channels);

  return UNITY_END();
}

#endif
