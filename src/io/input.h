#pragma once

#include <string>

#include "base.h"
#include "error.h"

namespace fog {

// a single digital input. read() gives the raw level: 1 high (open, pulled up), 0 low (closed).
class InputLine: public Named {
  public:
  InputLine(const std::string& id, const std::string& type = "input"):
    Named(id, type) {}
  virtual ~InputLine() {}

  // throws InputDeviceError: Unavailable if there's no such hardware at all, InitFailed otherwise
  virtual void open() = 0;
  // throws InputDeviceError(ReadFailed)
  virtual int read() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

}
