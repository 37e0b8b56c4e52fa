#include "store.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "config.h"
#include "error.h"
#include "log.h"
#include "util.h"

namespace fs = std::filesystem;

namespace fog {

JsonFileStore::JsonFileStore(const std::string& path, const Config& cfg):
  Store("json " + path), _path(path), cfg(cfg) {}

namespace {
// stored scene over the default: only known channels, values clamped, safety fixed
void readScene(const nlohmann::json& entry, Scene& scene, const std::string& key) {
  if(!entry.is_object()) {
    lg.f("Store", Log::WARNING, "{} is not an object, keeping default", key);
    return;
  }
  auto name = entry.find("name");
  if(name != entry.end() && name->is_string())
    scene.name = name->get<std::string>();

  auto channels = entry.find("channels");
  if(channels == entry.end() || !channels->is_object() || channels->empty())
    return; // keep default values

  for(auto& [chKey, val]: channels->items()) {
    int ch = 0;
    try {
      ch = util::toInt(chKey);
    } catch(const std::logic_error&) { // not a number, or a silly big one
      continue;
    }
    if(ch < 1 || ch > kFixtureChannels || !val.is_number()) continue;
    scene.at(ch) = (uint8_t)std::clamp(val.get<double>(), 0.0, 255.0); // clamp before narrowing
  }
  if(scene.sanitize())
    lg.f("Store", Log::WARNING, "{} had invalid safety value, corrected to {}", key, kSafetyDefault);
}
}

PersistedState JsonFileStore::fromJson(const nlohmann::json& doc) const {
  PersistedState state;
  state.duration = cfg.triggerDuration.defaultValue();
  if(!doc.is_object()) return state;

  auto duration = doc.find("scene_b_duration");
  if(duration != doc.end() && duration->is_number()) {
    double seconds = duration->get<double>();
    state.duration = cfg.clampDuration(seconds);
    if(state.duration != seconds)
      lg.f("Store", Log::WARNING, "scene_b_duration {} out of bounds, using {}", seconds, state.duration);
  }

  auto scenes = doc.find("scenes");
  if(scenes == doc.end() || !scenes->is_object()) return state;
  for(auto id: kSceneIds) {
    auto entry = scenes->find(key(id));
    if(entry != scenes->end())
      readScene(*entry, state.scenes[index(id)], key(id));
  }
  return state;
}

nlohmann::json JsonFileStore::toJson(const PersistedState& state) const {
  nlohmann::json scenes = nlohmann::json::object();
  for(auto id: kSceneIds) {
    const auto& scene = state.scenes[index(id)];
    nlohmann::json channels = nlohmann::json::object();
    for(uint16_t ch = 1; ch <= kFixtureChannels; ch++)
      channels[std::to_string(ch)] = scene.at(ch);
    scenes[key(id)] = {{"name", scene.name}, {"channels", channels}};
  }
  return {{"scene_b_duration", state.duration}, {"scenes", scenes}};
}

PersistedState JsonFileStore::load() {
  std::error_code ec;
  if(!fs::exists(_path, ec)) {
    lg.f("Store", Log::INFO, "No config at {}, using defaults", _path);
    return fromJson(nullptr);
  }
  std::ifstream in(_path);
  if(!in) {
    lg.f("Store", Log::WARNING, "Can't read {}, using defaults", _path);
    return fromJson(nullptr);
  }
  try {
    auto doc = nlohmann::json::parse(in);
    lg.f("Store", Log::INFO, "Loaded config from {}", _path);
    return fromJson(doc);
  } catch(const nlohmann::json::exception& e) {
    lg.f("Store", Log::WARNING, "Config {} is corrupt ({}), using defaults", _path, e.what());
    return fromJson(nullptr);
  }
}

void JsonFileStore::save(const PersistedState& state) {
  fs::path target(_path);
  std::error_code ec;
  if(target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if(ec) throw PersistenceError(fmt::format("can't create {}: {}", target.parent_path().string(), ec.message()));
  }

  std::string text;
  try {
    text = toJson(state).dump(2);
  } catch(const nlohmann::json::exception& e) { // names that aren't utf-8
    throw PersistenceError(fmt::format("can't serialize state: {}", e.what()));
  }

  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) throw PersistenceError("can't open " + tmp.string() + " for writing");
    out << text << '\n';
    out.flush();
    if(!out) throw PersistenceError("write to " + tmp.string() + " failed");
  }
  fs::rename(tmp, target, ec);
  if(ec) {
    auto reason = ec.message();
    fs::remove(tmp, ec);
    throw PersistenceError(fmt::format("can't replace {}: {}", _path, reason));
  }
  DEBUGF("Saved config to {}", _path);
}

}
