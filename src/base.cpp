#include "base.h"

#include <atomic>

#include <fmt/format.h>

namespace fog {

namespace {
UID generateUID() {
    static std::atomic<UID> i{0};
    return ++i;
}
}

Named::Named(const std::string& id, const std::string& type):
      _id(id), _type(type), _uid(generateUID()) {}

std::string Named::toString() const {
  return fmt::format("Type {}, id {}, {}. ", type(), id(), uid());
}


bool Runnable::run() {
  ts.attempt = Clock::now();
  count.attempt++;
  bool outcome = false;
  if(!_ready() || !_run()) {
    checkAndHandleTimeOut();

  } else { // success
    count.run++;
    if(!active()) {
      setActive(true);
      _onRestored();
    }
    ts.run = ts.attempt;
    outcome = true;
  }
  count.totalTime += Clock::now() - ts.attempt;
  return outcome;
}

std::string Runnable::toString() const {
  return Named::toString() + fmt::format("runs/drops {} / {}", count.run, count.attempt - count.run);
}

void Runnable::checkAndHandleTimeOut() {
  if(active() && idleTimeout > Millis::zero()
      && (ts.attempt - ts.run > idleTimeout)) {
      setActive(false);
      _onTimeout();
  }
}

}
