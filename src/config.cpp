#include "config.h"

#include <algorithm>
#include <cmath>

#include "io/ftdiaddress.h"
#include "log.h"
#include "util.h"

namespace fog {

Config::Config():
  durationMin("trigger_duration_min", "shortest allowed trigger duration, s"),
  durationMax("trigger_duration_max", "longest allowed trigger duration, s"),
  triggerDuration("scene_b_duration", "seconds scene B holds after a trigger before reverting to A"),
  contactPin("contact_pin", "gpio line offset of the contact closure input"),
  gpioChip("gpio_chip", "gpiochip to use, empty to scan all"),
  debounceMs("debounce_ms", "closures within this long of the last accepted one are ignored"),
  pollMs("poll_ms", "contact input poll interval"),
  transport("transport", "DMX adapter address"),
  refreshHz("refresh_hz", "dmx frame rate"),
  configFile("config_file", "where scenes and timing persist") {

  durationMin.setDefaultValue(0.5).setValidator([] (double val) {
      return std::isfinite(val) && val > 0; });
  durationMax.setDefaultValue(300.0).setValidator([this] (double val) {
      return std::isfinite(val) && val >= durationMin.get(); });
  triggerDuration.setDefaultValue(10.0).setValidator([this] (double val) {
      return std::isfinite(val) && val >= durationMin.get() && val <= durationMax.get(); });

  contactPin.setDefaultValue(17).setValidator([] (long val) {
      return (val >= 0 && val < 512); });
  gpioChip.setDefaultValue("");
  debounceMs.setDefaultValue(300).setValidator([] (long val) {
      return (val >= 0 && val <= 5000); });
  pollMs.setDefaultValue(50).setValidator([] (long val) {
      return (val > 0 && val <= 1000); });

  transport.setDefaultValue(FOG_DEFAULT_TRANSPORT).setValidator([] (const std::string& val) {
      try {
        FtdiAddress::parse(val);
        return true;
      } catch(const DeviceError&) {
        return false;
      }});
  refreshHz.setDefaultValue(44).setValidator([] (long val) {
      return (val > 0 && val <= 44); }); // 44 is as fast as a full 512 slot frame goes

  configFile.setDefaultValue(std::string(FOG_DEFAULT_CONFIG_DIR) + "/config.json")
            .setValidator([] (const std::string& val) { return !val.empty(); });
}

namespace {
template<class T, class Parse>
void fromEnv(Setting<T>& setting, const char* var, Parse parse) {
  auto raw = util::env(var);
  if(raw.empty()) return;
  try {
    setting.set(parse(raw));
    lg.f("Config", Log::INFO, "{} = {} (from {})", setting.name(), raw, var);
  } catch(const std::exception& e) {
    lg.f("Config", Log::WARNING, "Ignoring {}='{}': {}", var, raw, e.what());
  }
}
}

void Config::loadEnvironment() {
  auto str = [](const std::string& s) { return s; };
  fromEnv(transport, "DMX_FTDI_URL", str);
  fromEnv(contactPin, "DMX_CONTACT_PIN", [](const std::string& s) { return (long)util::toInt(s); });
  fromEnv(gpioChip, "DMX_GPIO_CHIP", str);

  auto dir = util::env("DMX_CONFIG_DIR");
  if(!dir.empty()) configFile.set(dir + "/config.json");
  fromEnv(configFile, "DMX_CONFIG_FILE", str);
}

void Config::setTriggerDuration(double seconds) {
  if(!triggerDuration.validate(seconds))
    throw ValidationError(ErrorCode::OutOfRange,
        fmt::format("trigger duration must be between {} and {} s", durationMin.get(), durationMax.get()));
  triggerDuration.set(seconds);
}

double Config::clampDuration(double seconds) const {
  if(!std::isfinite(seconds)) return triggerDuration.defaultValue();
  return std::clamp(seconds, durationMin.get(), durationMax.get());
}

nlohmann::json Config::toJson() const {
  return {
    {triggerDuration.name(), triggerDuration.get()},
    {durationMin.name(), durationMin.get()},
    {durationMax.name(), durationMax.get()},
    {contactPin.name(), contactPin.get()},
    {gpioChip.name(), gpioChip.get()},
    {debounceMs.name(), debounceMs.get()},
    {transport.name(), transport.get()},
    {refreshHz.name(), refreshHz.get()},
    {configFile.name(), configFile.get()},
  };
}

}
