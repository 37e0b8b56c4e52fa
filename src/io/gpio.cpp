#include "io/gpio.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <gpiod.h>

#include "log.h"

namespace fs = std::filesystem;

namespace fog {

GpioLine::GpioLine(unsigned int offset, const std::string& chip):
  InputLine(fmt::format("gpio {}", offset), "gpio"), _offset(offset), chip(chip) {}

GpioLine::~GpioLine() { close(); }

std::vector<std::string> GpioLine::listChips() {
  std::vector<std::string> chips;
  std::error_code ec;
  if(!fs::is_directory("/dev", ec)) return chips;
  for(auto& entry: fs::directory_iterator("/dev", ec)) {
    auto name = entry.path().filename().string();
    if(name.rfind("gpiochip", 0) == 0) chips.push_back(entry.path().string());
  }
  std::sort(chips.begin(), chips.end());
  return chips;
}

void GpioLine::open() {
  close();
  std::vector<std::string> candidates;
  if(!chip.empty()) candidates.push_back(chip);
  else candidates = listChips();
  if(candidates.empty())
    throw InputDeviceError(ErrorCode::Unavailable, "no gpio chips on this system");

  std::string lastError = "line " + std::to_string(_offset) + " not on any chip";
  for(auto& name: candidates) {
    gpiod_chip* c = gpiod_chip_open_lookup(name.c_str());
    if(!c) {
      lastError = fmt::format("{}: {}", name, std::strerror(errno));
      continue;
    }
    if(_offset >= gpiod_chip_num_lines(c)) {
      gpiod_chip_close(c);
      continue;
    }
    gpiod_line* l = gpiod_chip_get_line(c, _offset);
    if(!l || gpiod_line_request_input_flags(l, "fogdmx", GPIOD_LINE_REQUEST_FLAG_BIAS_PULL_UP) < 0) {
      lastError = fmt::format("{} line {}: {}", name, _offset, std::strerror(errno));
      gpiod_chip_close(c);
      continue;
    }
    handle = c;
    line = l;
    openedChip = name;
    lg.f("Gpio", Log::INFO, "Watching {} line {} (pull-up, active low)", name, _offset);
    return;
  }
  throw InputDeviceError(ErrorCode::InitFailed, lastError);
}

int GpioLine::read() {
  if(!line) throw InputDeviceError(ErrorCode::ReadFailed, "line not open");
  int value = gpiod_line_get_value(line);
  if(value < 0)
    throw InputDeviceError(ErrorCode::ReadFailed,
                           fmt::format("reading line {}: {}", _offset, std::strerror(errno)));
  return value;
}

void GpioLine::close() {
  if(line) gpiod_line_release(line);
  line = nullptr;
  if(handle) gpiod_chip_close(handle);
  handle = nullptr;
}

}
