#pragma once

#include <cstdint>
#include <string>

namespace fog {

// where to find the adapter. ftdi://vendor:product[:serial]/interface, pyftdi style
struct FtdiAddress {
  uint16_t vendor = 0x0403, product = 0x6001;
  std::string serial;    // empty = any
  uint8_t interface = 1; // 1 = A
  int index = 0;         // nth matching device

  // throws DeviceError(DeviceNotFound) for anything unparsable
  static FtdiAddress parse(const std::string& address);
  std::string toString() const;
};

}
