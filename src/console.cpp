#include "console.h"

#include <iostream>

#include <poll.h>
#include <unistd.h>

#include "log.h"

namespace fog {

Console::Console(const CommandRunner& runner, PrintFn print):
  Task("console", Millis(100)), runner(runner), print(std::move(print)) {}

void Console::handle(const std::string& text) {
  nlohmann::json result;
  try {
    result = runner.line(text);
  } catch(const std::exception& e) { // anything the runner didn't turn into json itself
    lg.f("Console", Log::ERROR, "Command '{}' failed: {}", text, e.what());
    result = {{"error", e.what()}, {"code", "Internal"}};
  }
  // replies echo what was typed, which may not be utf-8
  if(!result.is_null()) print(result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Console::tick() {
  if(eof) return;
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  if(::poll(&pfd, 1, 0) <= 0) return;

  do { // cin may have buffered more than the one line poll woke us for
    std::string text;
    if(!std::getline(std::cin, text)) {
      eof = true;
      LOG("stdin closed, console off");
      return;
    }
    handle(text);
  } while(std::cin.rdbuf()->in_avail() > 0);
}

}
