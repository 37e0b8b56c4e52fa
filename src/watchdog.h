#pragma once

#include <atomic>
#include <cstdint>

#include "util.h"

namespace fog {

/* loop watchdog, same idea as the mdEspRestart one but nobody gets restarted:
  Each loop iteration, first feed wdt:      feed();
  Stamp module ID before each part of loop: stamp(MODULE_ID);
  At end of loop, stamp wdt as finished:    stamp();
  Whoever reports health asks alive(), inLoop() says a loop is stuck mid pass. */
#define LWD_ID_LOOP_END        0xFFFFFFFF

#define FOG_OUTPUT_TRIGGER     42
#define FOG_OUTPUT_SEND        43
#define FOG_OUTPUT_RECONNECT   44

using lwdID_t = uint32_t;

class LoopWatchdog {
  public:
  LoopWatchdog(Clock::duration timeout = std::chrono::seconds(1)):
    timeout(timeout) {}

  void feed(TimePoint now = Clock::now()) {
    fedAt = now.time_since_epoch().count();
    fedOnce = true;
  }
  void stamp(lwdID_t id = LWD_ID_LOOP_END) { wd = id; }

  bool alive(TimePoint now = Clock::now()) const {
    if(!fedOnce) return false;
    return now - TimePoint(Clock::duration(fedAt.load())) < timeout;
  }
  bool inLoop() const { return wd != LWD_ID_LOOP_END; }

  private:
  Clock::duration timeout;
  std::atomic<Clock::rep> fedAt{0};
  std::atomic<bool> fedOnce{false};
  std::atomic<lwdID_t> wd{LWD_ID_LOOP_END};
};

}
