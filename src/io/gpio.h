#pragma once

#include <string>
#include <vector>

#include "io/input.h"

struct gpiod_chip;
struct gpiod_line;

namespace fog {

// one line off a /dev/gpiochipN, as input with the pull-up on
class GpioLine: public InputLine {
  public:
  // empty chip = first chip that has the line
  GpioLine(unsigned int offset, const std::string& chip = "");
  ~GpioLine();

  void open() override;
  int read() override;
  void close() override;
  bool isOpen() const override { return line != nullptr; }

  unsigned int offset() const { return _offset; }
  const std::string& chipName() const { return openedChip; }

  static std::vector<std::string> listChips();

  private:
  unsigned int _offset;
  std::string chip, openedChip;
  gpiod_chip* handle = nullptr;
  gpiod_line* line = nullptr;
};

}
