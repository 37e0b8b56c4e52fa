#pragma once

#include <atomic>
#include <memory>

#include <nlohmann/json.hpp>

#include "commands.h"
#include "config.h"
#include "console.h"
#include "controller.h"
#include "inputter.h"
#include "outputter.h"
#include "store.h"

namespace fog {

// the status document everyone gets: controller + output + input in one
nlohmann::json statusJson(const ControllerStatus& ctrl, const OutputLoop::Status& out,
                          ContactState contact, bool inputAvailable);

// everything a controller can be told, as commands. shared by the console and tests
void addCommands(CommandRunner& runner, Controller& controller, const Config& cfg,
                 std::function<nlohmann::json()> status);

class App {
  public:
  App();
  ~App();

  // env, logging, store, controller. scene A is on the frame when this returns
  void init();
  // starts the loops, blocks til requestStop() or SIGINT/SIGTERM
  int run();
  static void requestStop();
  static void installSignalHandlers();

  nlohmann::json status() const;

  private:
  Config cfg;
  std::unique_ptr<JsonFileStore> store;
  std::unique_ptr<Controller> controller;
  std::unique_ptr<OutputLoop> output;
  std::unique_ptr<InputMonitor> input;
  CommandRunner cmds;
  std::unique_ptr<Console> console;

  static std::atomic<bool> stopping;

  void logStats() const;
};

}
