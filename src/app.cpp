#include "app.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <csignal>
#include <iostream>
#include <thread>

#include "io/dmxserial.h"
#include "io/gpio.h"
#include "log.h"
#include "util.h"

namespace fog {

std::atomic<bool> App::stopping{false};

nlohmann::json statusJson(const ControllerStatus& ctrl, const OutputLoop::Status& out,
                          ContactState contact, bool inputAvailable) {
  nlohmann::json j;
  j["active_scene"] = toString(ctrl.active);
  j["transport_connected"] = out.connected;
  j["transport_error"] = out.lastError.empty()? nlohmann::json(nullptr): nlohmann::json(out.lastError);
  j["armed"] = ctrl.trigger.armed;
  j["remaining_seconds"] = ctrl.trigger.armed? std::round(ctrl.trigger.remainingSeconds * 10) / 10: 0.0;
  j["previous_scene"] = ctrl.trigger.previous? nlohmann::json(toString(*ctrl.trigger.previous)): nlohmann::json(nullptr);
  j["contact_state"] = toString(contact);
  j["input_available"] = inputAvailable;
  j["output_alive"] = out.alive;
  j["trigger_duration"] = ctrl.duration;
  j["channels"] = namedChannels(ctrl.frame);
  j["frames"] = {{"sent", out.sent}, {"dropped", out.dropped}};
  return j;
}

namespace {
const std::string& arg(const std::vector<std::string>& args, size_t i, const char* usage) {
  if(i >= args.size()) throw std::invalid_argument(std::string("usage: ") + usage);
  return args[i];
}

nlohmann::json sceneJson(const Scene& scene) {
  nlohmann::json channels = nlohmann::json::object();
  for(uint16_t ch = 1; ch <= kFixtureChannels; ch++)
    channels[std::to_string(ch)] = scene.at(ch);
  return {{"name", scene.name}, {"channels", channels}};
}

const nlohmann::json ok = {{"ok", true}};
}

void addCommands(CommandRunner& runner, Controller& controller, const Config& cfg,
                 std::function<nlohmann::json()> status) {
  runner.add("status", "full status", [status] (auto&) { return status(); });

  runner.add("trigger", "fire scene B, back to A after the trigger duration", [&controller] (auto&) {
      controller.fireTrigger();
      return nlohmann::json{{"ok", true}, {"duration", controller.triggerDuration()}};
  });

  runner.add("scene", "scene <a-d>: switch scene, cancels a running trigger", [&controller] (auto& args) {
      controller.selectScene(arg(args, 0, "scene <a-d>"));
      return ok;
  });

  runner.add("channel", "channel <1-512> <0-255>: set one channel", [&controller] (auto& args) {
      int ch = util::toInt(arg(args, 0, "channel <n> <value>"));
      int value = util::toInt(arg(args, 1, "channel <n> <value>"));
      controller.setChannel(ch, value);
      return ok;
  });

  runner.add("blackout", "everything off, safety kept valid", [&controller] (auto&) {
      controller.blackout();
      return ok;
  });

  runner.add("save", "save <a-d>: store current channels 1-16 in a scene", [&controller] (auto& args) {
      controller.saveScene(arg(args, 0, "save <a-d>"));
      return ok;
  });

  runner.add("update", "update <a-d> <ch>=<value>... [name=<text>]: edit a stored scene",
             [&controller] (auto& args) {
      const char* usage = "update <a-d> <ch>=<value>...";
      auto& name = arg(args, 0, usage);
      std::map<int, int> channels;
      std::optional<std::string> label;
      for(size_t i = 1; i < args.size(); i++) {
        auto eq = args[i].find('=');
        if(eq == std::string::npos) throw std::invalid_argument(std::string("usage: ") + usage);
        auto key = args[i].substr(0, eq), value = args[i].substr(eq + 1);
        if(key == "name") label = value;
        else channels[util::toInt(key)] = util::toInt(value);
      }
      controller.updateScene(name, channels, label);
      return ok;
  });

  runner.add("scenes", "list stored scenes", [&controller] (auto&) {
      nlohmann::json out = nlohmann::json::object();
      auto scenes = controller.scenes();
      for(auto id: kSceneIds) out[key(id)] = sceneJson(scenes[index(id)]);
      return out;
  });

  runner.add("config", "current configuration", [&controller, &cfg] (auto&) {
      auto out = cfg.toJson();
      out["scene_b_duration"] = controller.triggerDuration();
      return out;
  });

  runner.add("duration", "duration [seconds]: get or set the trigger duration", [&controller] (auto& args) {
      if(!args.empty()) controller.setTriggerDuration(util::toDouble(args[0]));
      return nlohmann::json{{"scene_b_duration", controller.triggerDuration()}};
  });

  runner.add("help", "this", [&runner] (auto&) { return runner.help(); });
}


App::App() {}

App::~App() {
  console.reset(); // stop in reverse
  input.reset();
  output.reset();
}

void App::init() {
  auto level = util::env("DMX_LOG_LEVEL");
  if(!level.empty()) {
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) { return std::toupper(c); });
    auto lvl = lg.convert(level);
    if(lvl == Log::INVALID) lg.f("App", Log::WARNING, "Unknown DMX_LOG_LEVEL '{}'", level);
    else lg.setLevel(lvl);
  }
  auto logFile = util::env("DMX_LOG_FILE");
  if(!logFile.empty()) lg.initOutput(logFile);

  cfg.loadEnvironment();
  lg.f("App", Log::INFO, "Transport {}, contact pin {}, config {}",
       cfg.transport.get(), cfg.contactPin.get(), cfg.configFile.get());

  store = std::make_unique<JsonFileStore>(cfg.configFile, cfg);
  controller = std::make_unique<Controller>(cfg, store.get());
  controller->load(); // scene A on the frame before anything is sent

  std::string address = cfg.transport;
  output = std::make_unique<OutputLoop>(*controller, address,
                                        [address] { return makeTransport(address); },
                                        (uint16_t)cfg.refreshHz.get());
  input = std::make_unique<InputMonitor>(*controller,
                                         std::make_unique<GpioLine>((unsigned)cfg.contactPin.get(), cfg.gpioChip),
                                         Millis(cfg.debounceMs.get()), Millis(cfg.pollMs.get()));

  addCommands(cmds, *controller, cfg, [this] { return status(); });
  console = std::make_unique<Console>(cmds, [](const std::string& line) { std::cout << line << std::endl; });
}

nlohmann::json App::status() const {
  return statusJson(controller->status(), output->status(), input->contact(), input->available());
}

void App::logStats() const {
  auto out = output->status();
  lg.f("App", Log::INFO, "{} frames sent, {} dropped, {} triggers, transport {}",
       out.sent, out.dropped, controller->triggerCount(), out.connected? "up": "down");
}

int App::run() {
  output->start();
  input->start();
  console->start();
  LOG("Running");

  auto lastStats = Clock::now();
  while(!stopping) {
    std::this_thread::sleep_for(Millis(100));
    if(Clock::now() - lastStats >= std::chrono::seconds(60)) {
      logStats();
      lastStats = Clock::now();
    }
  }

  LOG("Shutting down");
  console->stop();
  input->stop();
  output->stop();
  logStats();
  LOG("Shutdown complete");
  return 0;
}

void App::requestStop() {
  stopping = true;
}

namespace {
void onSignal(int) { App::requestStop(); }
}

void App::installSignalHandlers() {
  struct sigaction sa{};
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  signal(SIGPIPE, SIG_IGN);
}

}
