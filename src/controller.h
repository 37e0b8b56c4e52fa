#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "base.h"
#include "frame.h"
#include "scene.h"
#include "store.h"

namespace fog {

class Config;

// what the frame currently is, as far as anyone asking is concerned
enum class ActiveLabel: uint8_t { A = 0, B, C, D, Custom, None };
ActiveLabel labelFor(SceneId id);
std::string toString(ActiveLabel label); // "a".."d", "custom", "none"

struct TriggerStatus {
  bool armed = false;
  double remainingSeconds = 0;
  std::optional<ActiveLabel> previous; // what was showing when the trigger fired
};

struct ControllerStatus {
  ActiveLabel active;
  TriggerStatus trigger;
  double duration;
  FrameData frame;
};

/* Scene/trigger state machine. Owns the only ChannelFrame.
  Everything mutating takes one lock for frame+scenes+trigger together, so a reader never sees
  scene applied without the trigger state that goes with it.
  Trigger expiry is a deadline checked by tick(), never a timer that needs cancelling:
  fire/select/blackout just replace or drop the deadline.
  Persistence happens after the lock is released, from a snapshot. */
class Controller: public Named {
  public:
  using ClockFn = std::function<TimePoint()>;

  Controller(Config& cfg, Store* store = nullptr, ClockFn clock = [] { return Clock::now(); });

  // store contents, or defaults. scene A goes on the frame
  void load();

  // throws ValidationError (OutOfRange, SafetyViolation). label turns Custom, trigger untouched
  void setChannel(int channel, int value);
  // cancels any armed trigger. throws ValidationError(UnknownScene)
  void selectScene(const std::string& name);
  void selectScene(SceneId id);
  // B now, back to A after duration. refiring restarts the countdown
  void fireTrigger();
  // all zero except safety 100. disarms without going through A
  void blackout();
  // snapshot channels 1-16 into slot. PersistenceError is logged, never thrown
  void saveScene(const std::string& name);
  void saveScene(SceneId id);
  // set some channels of a stored scene, validated like setChannel
  void updateScene(const std::string& name, const std::map<int, int>& channels,
                   const std::optional<std::string>& label = std::nullopt);

  // throws ValidationError(OutOfRange)
  void setTriggerDuration(double seconds);
  double triggerDuration() const;

  // expires the trigger if due. true if it did
  bool tick(TimePoint now);
  bool tick() { return tick(clock()); }

  ControllerStatus status() const;
  FrameData frameSnapshot() const;
  std::map<std::string, int> channels() const; // by fixture channel name
  Scenes scenes() const;
  ActiveLabel active() const;
  bool armed() const;

  uint32_t triggerCount() const { return triggers; }

  private:
  struct Armed {
    TimePoint deadline;
    ActiveLabel previous;
  };

  Config& cfg;
  Store* store;
  ClockFn clock;

  mutable std::mutex mutex; // frame, scenes, label, armed, duration
  ChannelFrame frame;
  Scenes _scenes = defaultScenes();
  ActiveLabel _active = ActiveLabel::A;
  std::optional<Armed> _armed;
  double duration;

  std::mutex persistMutex;
  uint64_t generation = 0;      // bumped under mutex on every change worth saving
  uint64_t savedGeneration = 0; // guarded by persistMutex
  std::atomic<uint32_t> triggers{0};

  void applyLocked(SceneId id);
  // call with mutex held. returns what to hand persist()
  std::pair<uint64_t, PersistedState> snapshotLocked();
  void persist(uint64_t gen, const PersistedState& state);
};

}
