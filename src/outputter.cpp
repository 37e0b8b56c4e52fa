#include "outputter.h"

#include <algorithm>

#include "controller.h"
#include "log.h"

namespace fog {

OutputLoop::OutputLoop(Controller& controller, const std::string& address,
                       TransportFactory factory, uint16_t hz):
  Task("output", std::chrono::microseconds(1000000 / std::max<uint16_t>(hz, 1))),
  Runnable("DMX out", "output"),
  controller(controller), address(address), factory(std::move(factory)) {
}

OutputLoop::~OutputLoop() {
  stop();
  if(transport) transport->close();
}

void OutputLoop::step(TimePoint now) {
  stepTime = now;
  wd.feed(now);
  wd.stamp(FOG_OUTPUT_TRIGGER);
  controller.tick(now);

  if(state == State::Reconnecting && now >= _nextAttempt) {
    wd.stamp(FOG_OUTPUT_RECONNECT);
    reconnect(now);
  }
  if(state == State::Sending) {
    wd.stamp(FOG_OUTPUT_SEND);
    frame = controller.frameSnapshot();
    run();
    sent = count.run;
    dropped = count.attempt - count.run;
  }
  lg.fEvery(2640, 1, "Output", Log::DEBUG, "{} frames sent, {} dropped", sent.load(), dropped.load());
  wd.stamp();
}

bool OutputLoop::_run() {
  try {
    transport->send(frame);
    failures = 0;
    _connected = true;
    return true;
  } catch(const DeviceError& e) {
    failures++;
    setError(e.what());
    lg.fEvery(44, 2, "Output", Log::WARNING, "Send failed ({}/{}): {}", failures, maxFailures, e.what());
    if(failures >= maxFailures) {
      lg.f("Output", Log::ERROR, "{} sends failed in a row, reopening transport", failures);
      transport->close();
      _connected = false;
      state = State::Reconnecting;
      _backoff = backoffStart;
      scheduleRetry(stepTime);
    }
    return false;
  }
}

void OutputLoop::reconnect(TimePoint now) {
  try {
    if(!transport) transport = factory();
    transport->open(address);
  } catch(const DeviceError& e) {
    setError(e.what());
    if(transport) transport->close();
    transport.reset(); // next attempt gets a fresh one
    lg.f("Output", Log::WARNING, "Transport open failed [{}]: {}, retry in {}s", e.codeName(), e.what(),
         std::chrono::duration_cast<std::chrono::seconds>(_backoff).count());
    scheduleRetry(now);
    return;
  }
  state = State::Sending;
  failures = 0;
  _backoff = backoffStart;
  _connected = true;
  LOG("Transport connected");
}

void OutputLoop::scheduleRetry(TimePoint now) {
  _nextAttempt = now + _backoff;
  _backoff = std::min<Clock::duration>(_backoff * 2, backoffMax);
}

void OutputLoop::setError(const std::string& error) {
  std::lock_guard<std::mutex> lock(errorMutex);
  lastError = error;
}

void OutputLoop::_onTimeout() {
  WARN("No DMX frames out for a while");
}

void OutputLoop::_onRestored() {
  LOG("DMX frames flowing again");
}

void OutputLoop::deinit() {
  if(transport) transport->close();
  _connected = false;
  lg.f("Output", Log::INFO, "Stopped, {} frames sent, {} dropped", sent.load(), dropped.load());
}

OutputLoop::Status OutputLoop::status(TimePoint now) const {
  Status s;
  s.connected = _connected;
  s.alive = running() && wd.alive(now);
  s.sent = sent;
  s.dropped = dropped;
  std::lock_guard<std::mutex> lock(errorMutex);
  s.lastError = lastError;
  return s;
}

}
