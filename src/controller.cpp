#include "controller.h"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "config.h"
#include "error.h"
#include "log.h"

namespace fog {

namespace {
// names end up in json, which only takes utf-8
void validateName(const std::string& name) {
  try {
    nlohmann::json(name).dump();
  } catch(const nlohmann::json::type_error&) {
    throw ValidationError(ErrorCode::OutOfRange, "scene name is not valid UTF-8");
  }
}
}

ActiveLabel labelFor(SceneId id) {
  return static_cast<ActiveLabel>(index(id));
}

std::string toString(ActiveLabel label) {
  switch(label) {
    case ActiveLabel::Custom: return "custom";
    case ActiveLabel::None:   return "none";
    default: return letter(static_cast<SceneId>(label));
  }
}

Controller::Controller(Config& cfg, Store* store, ClockFn clock):
  Named("controller", "state"), cfg(cfg), store(store), clock(std::move(clock)),
  duration(cfg.triggerDuration.get()) {
  frame.apply(_scenes[index(kIdleScene)]);
}

void Controller::load() {
  PersistedState state;
  state.duration = cfg.triggerDuration.get();
  if(store) state = store->load();

  double seconds = cfg.clampDuration(state.duration);
  {
    std::lock_guard<std::mutex> lock(mutex);
    _scenes = state.scenes;
    for(auto& scene: _scenes) scene.sanitize(); // store should have, but nothing goes on the wire unchecked
    duration = seconds;
    cfg.triggerDuration.set(seconds);
    _armed.reset();
    applyLocked(kIdleScene);
  }
  lg.f("Controller", Log::INFO, "Scenes loaded, trigger duration {}s", seconds);
}


void Controller::applyLocked(SceneId id) {
  frame.apply(_scenes[index(id)]);
  _active = labelFor(id);
}

std::pair<uint64_t, PersistedState> Controller::snapshotLocked() {
  PersistedState state;
  state.scenes = _scenes;
  state.duration = duration;
  return {++generation, state};
}

void Controller::persist(uint64_t gen, const PersistedState& state) {
  if(!store) return;
  std::lock_guard<std::mutex> lock(persistMutex);
  if(gen <= savedGeneration) return; // somebody already wrote something newer
  try {
    store->save(state);
    savedGeneration = gen;
  } catch(const PersistenceError& e) {
    lg.f("Controller", Log::ERROR, "Change not persisted: {}", e.what());
  }
}


void Controller::setChannel(int channel, int value) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    frame.set(channel, value);
    _active = ActiveLabel::Custom;
  }
  DEBUGF("ch {} = {}", channel, value);
}

void Controller::selectScene(const std::string& name) {
  selectScene(sceneFromName(name));
}

void Controller::selectScene(SceneId id) {
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    cancelled = _armed.has_value();
    _armed.reset();
    applyLocked(id);
  }
  lg.f("Controller", Log::INFO, "Scene {} selected{}", letter(id), cancelled? ", trigger cancelled": "");
}

void Controller::fireTrigger() {
  auto now = clock();
  bool refired = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    refired = _armed.has_value();
    auto previous = refired? _armed->previous: _active;
    applyLocked(kTriggeredScene);
    _armed = Armed{now + util::fromSeconds(duration), previous};
  }
  triggers++;
  lg.f("Controller", Log::INFO, "Trigger {}, scene B for {}s", refired? "restarted": "fired", triggerDuration());
}

void Controller::blackout() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    frame.blackout();
    _armed.reset();
    _active = ActiveLabel::None;
  }
  LOG("Blackout");
}

bool Controller::tick(TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if(!_armed || now < _armed->deadline) return false;
    _armed.reset();
    applyLocked(kIdleScene);
  }
  LOG("Trigger expired, back to scene A");
  return true;
}


void Controller::saveScene(const std::string& name) {
  saveScene(sceneFromName(name));
}

void Controller::saveScene(SceneId id) {
  std::pair<uint64_t, PersistedState> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto& scene = _scenes[index(id)];
    const auto& data = frame.data();
    std::copy(data.begin() + 1, data.begin() + 1 + kFixtureChannels, scene.values.begin());
    scene.sanitize();
    snapshot = snapshotLocked();
  }
  lg.f("Controller", Log::INFO, "Current channels saved to scene {}", letter(id));
  persist(snapshot.first, snapshot.second);
}

void Controller::updateScene(const std::string& name, const std::map<int, int>& channels,
                             const std::optional<std::string>& label) {
  auto id = sceneFromName(name);
  for(auto& [ch, value]: channels) // all or nothing
    ChannelFrame::validate(ch, value, kFixtureChannels);
  if(label) validateName(*label);

  std::pair<uint64_t, PersistedState> snapshot;
  bool reapplied = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto& scene = _scenes[index(id)];
    for(auto& [ch, value]: channels)
      scene.at(ch) = (uint8_t)value;
    if(label) scene.name = *label;
    if(_active == labelFor(id) && !_armed) {
      applyLocked(id);
      reapplied = true;
    }
    snapshot = snapshotLocked();
  }
  lg.f("Controller", Log::INFO, "Scene {} updated ({} channels){}",
       letter(id), channels.size(), reapplied? ", reapplied": "");
  persist(snapshot.first, snapshot.second);
}


void Controller::setTriggerDuration(double seconds) {
  std::pair<uint64_t, PersistedState> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex);
    cfg.setTriggerDuration(seconds); // throws before anything changes
    duration = seconds;
    snapshot = snapshotLocked();
  }
  lg.f("Controller", Log::INFO, "Trigger duration now {}s", seconds);
  persist(snapshot.first, snapshot.second);
}

double Controller::triggerDuration() const {
  std::lock_guard<std::mutex> lock(mutex);
  return duration;
}


ControllerStatus Controller::status() const {
  auto now = clock();
  std::lock_guard<std::mutex> lock(mutex);
  ControllerStatus s{_active, {}, duration, frame.data()};
  if(_armed) {
    s.trigger.armed = true;
    s.trigger.remainingSeconds = std::max(0.0, util::secondsBetween(now, _armed->deadline));
    s.trigger.previous = _armed->previous;
  }
  return s;
}

FrameData Controller::frameSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  return frame.data();
}

std::map<std::string, int> Controller::channels() const {
  return namedChannels(frameSnapshot());
}

Scenes Controller::scenes() const {
  std::lock_guard<std::mutex> lock(mutex);
  return _scenes;
}

ActiveLabel Controller::active() const {
  std::lock_guard<std::mutex> lock(mutex);
  return _active;
}

bool Controller::armed() const {
  std::lock_guard<std::mutex> lock(mutex);
  return _armed.has_value();
}

}
