#include "scene.h"

#include "error.h"
#include "util.h"

namespace fog {

SceneId sceneFromName(const std::string& name) {
  auto n = util::toLower(util::trim(name));
  if(n.rfind("scene_", 0) == 0) n = n.substr(6);
  if(n.size() == 1 && n[0] >= 'a' && n[0] <= 'd')
    return static_cast<SceneId>(n[0] - 'a');
  throw ValidationError(ErrorCode::UnknownScene, "no such scene '" + name + "'");
}

std::string letter(SceneId id) {
  return std::string(1, (char)('a' + index(id)));
}

std::string key(SceneId id) {
  return "scene_" + letter(id);
}

bool Scene::sanitize() {
  if(validSafetyValue(safety())) return false;
  at(kSafetyChannel) = kSafetyDefault;
  return true;
}

Scenes defaultScenes() {
  //               fog  -   oR   oG   oB  oA   iR   iG   iB  iA  m1 m2 auto strb dim  safety
  return {{
    {"All OFF (Default)",
      {  0,  0,   0,   0,   0,   0,   0,   0,   0,   0, 0, 0,   0,   0,   0, 100}},
    {"Fog ON (Triggered)",
      {255,  0, 255, 255, 255,   0, 255, 255, 255,   0, 0, 0,   0,   0, 255, 100}},
    {"Custom Scene 1",
      {255,  0,   0,   0, 255,   0,   0,   0, 255,   0, 0, 0,   0,  50, 200, 100}},
    {"Custom Scene 2",
      {200,  0, 255,   0,   0, 200, 255,   0,   0, 200, 0, 0, 100,   0, 255, 100}},
  }};
}

const std::array<const char*, kFixtureChannels> kChannelNames{
  "fog", "disabled",
  "outer_red", "outer_green", "outer_blue", "outer_amber",
  "inner_red", "inner_green", "inner_blue", "inner_amber",
  "led_mix1", "led_mix2", "auto_color", "strobe", "dimmer", "safety"
};

std::map<std::string, int> namedChannels(const FrameData& data) {
  std::map<std::string, int> m;
  for(uint16_t ch = 1; ch <= kFixtureChannels; ch++) {
    if(ch == 2) continue; // nothing there
    m[kChannelNames[ch - 1]] = data[ch];
  }
  return m;
}

}
