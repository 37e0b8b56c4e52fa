#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "base.h"

namespace fog {

// A thread calling tick() every interval until stopped. Ticks are scheduled
// off the start time so a slow tick doesn't make the rate drift, but a tick
// that overruns a whole interval just gets skipped instead of bunching up.
// Subclasses must stop() in their own dtor, tick() is virtual.
class Task {
  public:
  Task(const std::string& name, Clock::duration interval):
    _name(name), _interval(interval) {}
  virtual ~Task() { stop(); }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  void start();
  void stop(); // cooperative, returns once the thread has exited
  bool running() const { return _running; }
  bool stopRequested() const { return _stopRequested; }

  const std::string& name() const { return _name; }
  Clock::duration interval() const { return _interval; }

  protected:
  virtual void init() {}
  virtual void tick() = 0;
  virtual void deinit() {}

  private:
  void exec();

  std::string _name;
  Clock::duration _interval;
  std::thread thread;
  std::atomic<bool> _running{false}, _stopRequested{false};
  std::mutex mutex;
  std::condition_variable wake;
};


}
