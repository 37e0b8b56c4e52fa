#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>

#include "frame.h"

namespace fog {

enum class SceneId: uint8_t { A = 0, B, C, D };
constexpr size_t kSceneCount = 4;
constexpr std::array<SceneId, kSceneCount> kSceneIds{SceneId::A, SceneId::B, SceneId::C, SceneId::D};

// A is what we sit at idle, B is what a trigger fires
constexpr SceneId kIdleScene      = SceneId::A;
constexpr SceneId kTriggeredScene = SceneId::B;

// "a", "A", "scene_a" all fine. throws ValidationError(UnknownScene)
SceneId sceneFromName(const std::string& name);
std::string letter(SceneId id); // "a"
std::string key(SceneId id);    // "scene_a", what it's stored as
inline size_t index(SceneId id) { return static_cast<size_t>(id); }

// values for channels 1-16. all scenes include the safety channel.
struct Scene {
  std::string name;
  std::array<uint8_t, kFixtureChannels> values{};

  uint8_t& at(uint16_t channel) { return values.at(channel - 1); }
  uint8_t  at(uint16_t channel) const { return values.at(channel - 1); }
  uint8_t  safety() const { return at(kSafetyChannel); }

  // forces safety into 50-200 (to 100). true if anything changed
  bool sanitize();

  bool operator==(const Scene& rhs) const { return name == rhs.name && values == rhs.values; }
};

using Scenes = std::array<Scene, kSceneCount>;

Scenes defaultScenes();

// DJPOWER H-IP20V fog machine, 16 channel mode
//  1 fog            2 unused
//  3-6 outer R G B amber   7-10 inner R G B amber
//  11 led mix 1    12 led mix 2   13 auto color   14 strobe   15 dimmer
//  16 safety (0-49 and 201-255 make the fixture ignore DMX)
extern const std::array<const char*, kFixtureChannels> kChannelNames;

std::map<std::string, int> namedChannels(const FrameData& data);

}
