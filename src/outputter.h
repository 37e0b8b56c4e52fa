#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "base.h"
#include "frame.h"
#include "task.h"
#include "watchdog.h"
#include "io/transport.h"

namespace fog {

class Controller;

/* Pushes the controller's frame out at a fixed rate, forever.
  Sending: each tick sends the latest frame. 3 failures in a row closes the transport.
  Reconnecting: reopen attempts spaced 1, 2, 4, 8, 10, 10... seconds. a good open goes back to Sending.
  Transport errors stop here, they only show up in status().
  Also the thing that expires the trigger, every tick, whatever the transport is up to. */
class OutputLoop: public Task, public Runnable {
  public:
  using TransportFactory = std::function<std::unique_ptr<Transport>()>;

  OutputLoop(Controller& controller, const std::string& address,
             TransportFactory factory, uint16_t hz = 44);
  ~OutputLoop() override;

  // one tick, what the thread does every 1/hz
  void step(TimePoint now);

  struct Status {
    bool connected = false;
    std::string lastError;
    bool alive = false;
    uint32_t sent = 0, dropped = 0;
  };
  Status status(TimePoint now = Clock::now()) const;

  bool connected() const { return _connected; }
  bool reconnecting() const { return state == State::Reconnecting; }
  Clock::duration backoff() const { return _backoff; }
  TimePoint nextAttempt() const { return _nextAttempt; }
  const LoopWatchdog& watchdog() const { return wd; }

  static constexpr uint8_t maxFailures = 3;
  static constexpr std::chrono::seconds backoffStart{1}, backoffMax{10};

  protected:
  void tick() override { step(Clock::now()); }
  void deinit() override;

  private:
  enum class State { Sending, Reconnecting };

  Controller& controller;
  std::string address;
  TransportFactory factory;
  std::unique_ptr<Transport> transport;
  LoopWatchdog wd;

  std::atomic<State> state{State::Reconnecting};
  TimePoint _nextAttempt{}; // epoch, so first step opens straight away
  Clock::duration _backoff = backoffStart;
  uint8_t failures = 0;
  TimePoint stepTime;
  FrameData frame{};

  std::atomic<bool> _connected{false};
  std::atomic<uint32_t> sent{0}, dropped{0};
  mutable std::mutex errorMutex;
  std::string lastError;

  bool _run() override; // the send
  void _onTimeout() override;
  void _onRestored() override;

  void reconnect(TimePoint now);
  void scheduleRetry(TimePoint now);
  void setError(const std::string& error);
};

}
