#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "task.h"
#include "io/input.h"

namespace fog {

class Controller;

enum class ContactState: uint8_t { Unknown, Open, Closed, Unavailable };
std::string toString(ContactState state);

/* Polls the contact line, fires the trigger on open -> closed.
  Initializing -> Reading. a failed read goes Retrying(n), a good one back to Reading,
  the 3rd failure in a row closes the line and goes Reinitializing, which tries every 5s.
  No gpio hardware at all is Unavailable, for good. */
class InputMonitor: public Task {
  public:
  enum class State: uint8_t { Initializing, Reading, Retrying, Reinitializing, Unavailable };

  InputMonitor(Controller& controller, std::unique_ptr<InputLine> line,
               Millis debounce = Millis(300), Millis poll = Millis(50));
  ~InputMonitor() override;

  void step(TimePoint now);

  State state() const { return _state; }
  ContactState contact() const { return _contact; }
  bool available() const { return _state != State::Unavailable; }
  uint8_t retries() const { return failures; }
  uint32_t triggerCount() const { return triggers; }

  static constexpr uint8_t maxFailures = 3;
  static constexpr Millis retryDelay{1000};
  static constexpr Millis reinitDelay{5000};

  protected:
  void tick() override { step(Clock::now()); }
  void deinit() override;

  private:
  Controller& controller;
  std::unique_ptr<InputLine> line;
  Millis debounce;

  std::atomic<State> _state{State::Initializing};
  std::atomic<ContactState> _contact{ContactState::Unknown};
  TimePoint notBefore{};            // earliest next init/read attempt
  int lastLevel = -1;               // -1 = nothing read since (re)init
  bool accepted = false;
  TimePoint lastAccepted{};
  uint8_t failures = 0;
  std::atomic<uint32_t> triggers{0};

  void tryOpen(TimePoint now);
  void read(TimePoint now);
};

}
