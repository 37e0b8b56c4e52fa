#include "task.h"

#include "log.h"

namespace fog {

void Task::start() {
  if(_running) return;
  if(thread.joinable()) thread.join(); // previous run that exited on its own
  _stopRequested = false;
  _running = true;
  thread = std::thread(&Task::exec, this);
}

void Task::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    _stopRequested = true;
  }
  wake.notify_all();
  if(thread.joinable() && thread.get_id() != std::this_thread::get_id())
    thread.join();
}

void Task::exec() {
  lg.f(_name, Log::DEBUG, "Task started, interval {} ms",
       std::chrono::duration_cast<Millis>(_interval).count());
  try {
    init();
    auto next = Clock::now();
    while(!_stopRequested) {
      tick();
      next += _interval;
      auto now = Clock::now();
      if(next < now) next = now; // overran, don't try to catch up
      std::unique_lock<std::mutex> lock(mutex);
      wake.wait_until(lock, next, [this] { return _stopRequested.load(); });
    }
    deinit();
  } catch(const std::exception& e) {
    lg.f(_name, Log::CRITICAL, "Task died: {}", e.what());
  }
  _running = false;
  lg.f(_name, Log::DEBUG, "Task stopped");
}

}
