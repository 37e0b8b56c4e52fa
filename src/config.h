#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "error.h"

namespace fog {

// A named value with a default and a validator. set() refuses anything the validator doesn't like.
template<class T>
class Setting {
  public:
  using Validator = std::function<bool(const T&)>;

  Setting(const std::string& name, const std::string& description):
    _name(name), _description(description) {}

  Setting& setDefaultValue(const T& value) { _default = _value = value; return *this; }
  Setting& setValidator(Validator validator) { _validator = std::move(validator); return *this; }

  const T& get() const { return _value; }
  operator const T&() const { return _value; }
  const T& defaultValue() const { return _default; }

  bool validate(const T& value) const { return !_validator || _validator(value); }
  void set(const T& value) {
    if(!validate(value))
      throw ValidationError(ErrorCode::OutOfRange, "invalid value for " + _name);
    _value = value;
  }
  void reset() { _value = _default; }

  const std::string& name() const { return _name; }
  const std::string& description() const { return _description; }

  private:
  std::string _name, _description;
  T _value{}, _default{};
  Validator _validator;
};

using optBool   = Setting<bool>;
using optInt    = Setting<long>;
using optFloat  = Setting<double>;
using optString = Setting<std::string>;


#define FOG_DEFAULT_TRANSPORT    "ftdi://0403:6001/1"
#define FOG_DEFAULT_CONFIG_DIR   "/var/lib/dmx"

class Config {
  public:
  Config();
  Config(const Config&) = delete; // validators hold this
  Config& operator=(const Config&) = delete;

  optFloat  durationMin;
  optFloat  durationMax;
  optFloat  triggerDuration;  // how long scene B holds after a trigger

  optInt    contactPin;
  optString gpioChip;         // empty = try every /dev/gpiochip*
  optInt    debounceMs;
  optInt    pollMs;

  optString transport;        // ftdi:// url, or "auto"
  optInt    refreshHz;

  optString configFile;

  // DMX_FTDI_URL, DMX_CONFIG_DIR, DMX_CONFIG_FILE, DMX_CONTACT_PIN, DMX_GPIO_CHIP.
  // anything not passing validation is logged and left at default
  void loadEnvironment();

  // checks bounds, throws ValidationError(OutOfRange)
  void setTriggerDuration(double seconds);
  double clampDuration(double seconds) const;

  nlohmann::json toJson() const;
};

}
