#pragma once

#include <memory>
#include <string>

#include "base.h"
#include "error.h"
#include "frame.h"

namespace fog {

// something a whole DMX frame can be pushed through.
// Doesn't retry anything itself, owner decides when to give up on it and reopen.
class Transport: public Named {
  public:
  Transport(const std::string& id, const std::string& type = "transport"):
    Named(id, type) {}
  virtual ~Transport() {}

  // throws DeviceError: DeviceNotFound, PermissionDenied, Busy
  virtual void open(const std::string& address) = 0;
  // start code + 512 channels incl break/mark timing. throws DeviceError(IoError)
  virtual void send(const FrameData& frame) = 0;
  // fine to call whenever, open or not
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

// picks implementation from address. only ftdi:// (and "auto") so far
std::unique_ptr<Transport> makeTransport(const std::string& address);

}
