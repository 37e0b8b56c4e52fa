#pragma once

#include <functional>
#include <string>

#include "commands.h"
#include "task.h"

namespace fog {

// feeds lines off stdin to a CommandRunner, prints what comes back as one line of json.
// stdin closing just turns the console off.
class Console: public Task {
  public:
  using PrintFn = std::function<void(const std::string&)>;

  Console(const CommandRunner& runner, PrintFn print);
  ~Console() override { stop(); }

  // one line, as if typed
  void handle(const std::string& text);
  bool closed() const { return eof; }

  protected:
  void tick() override;

  private:
  const CommandRunner& runner;
  PrintFn print;
  bool eof = false;
};

}
