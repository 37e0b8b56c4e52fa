#include "inputter.h"

#include "controller.h"
#include "log.h"

namespace fog {

std::string toString(ContactState state) {
  switch(state) {
    case ContactState::Open:        return "open";
    case ContactState::Closed:      return "closed";
    case ContactState::Unavailable: return "unavailable";
    default:                        return "unknown";
  }
}

InputMonitor::InputMonitor(Controller& controller, std::unique_ptr<InputLine> line,
                           Millis debounce, Millis poll):
  Task("input", poll), controller(controller), line(std::move(line)), debounce(debounce) {
}

InputMonitor::~InputMonitor() {
  stop();
  if(line) line->close();
}

void InputMonitor::step(TimePoint now) {
  switch(_state.load()) {
    case State::Unavailable: return;
    case State::Initializing:
    case State::Reinitializing:
      if(now >= notBefore) tryOpen(now);
      break;
    case State::Reading:
    case State::Retrying:
      if(now >= notBefore) read(now);
      break;
  }
}

void InputMonitor::tryOpen(TimePoint now) {
  bool first = _state == State::Initializing;
  try {
    line->open();
  } catch(const InputDeviceError& e) {
    if(e.code() == ErrorCode::Unavailable) {
      _state = State::Unavailable;
      _contact = ContactState::Unavailable;
      lg.f("Input", Log::WARNING, "No contact input on this system ({}), trigger only via commands", e.what());
      return;
    }
    _state = State::Reinitializing; // from here on it's all retries
    notBefore = now + reinitDelay;
    lg.f("Input", first? Log::WARNING: Log::DEBUG, "Input init failed: {}, retrying every {}s",
         e.what(), std::chrono::duration_cast<std::chrono::seconds>(reinitDelay).count());
    return;
  }
  lastLevel = -1; // no edge across a reinit
  failures = 0;
  _state = State::Reading;
  lg.f("Input", Log::INFO, "Contact input {}", first? "ready": "reinitialized");
}

void InputMonitor::read(TimePoint now) {
  int level = 0;
  try {
    level = line->read();
  } catch(const InputDeviceError& e) {
    failures++;
    lg.f("Input", Log::WARNING, "Read failed ({}/{}): {}", failures, maxFailures, e.what());
    if(failures >= maxFailures) {
      line->close();
      failures = 0;
      lastLevel = -1;
      _contact = ContactState::Unknown;
      _state = State::Reinitializing;
      notBefore = now;
      WARN("Reinitializing contact input");
    } else {
      _state = State::Retrying;
      notBefore = now + retryDelay;
    }
    return;
  }

  failures = 0;
  _state = State::Reading;
  _contact = level? ContactState::Open: ContactState::Closed;

  if(lastLevel == 1 && level == 0) {
    if(!accepted || now - lastAccepted >= debounce) {
      accepted = true;
      lastAccepted = now;
      triggers++;
      LOG("Contact closed, triggering");
      controller.fireTrigger();
    } else {
      DEBUG("Closure inside debounce window, ignored");
    }
  }
  lastLevel = level;
}

void InputMonitor::deinit() {
  if(line) line->close();
}

}
