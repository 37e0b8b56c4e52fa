#pragma once

#include <cstdint>
#include <string>

#include "io/ftdiaddress.h"
#include "io/transport.h"

struct ftdi_context;

namespace fog {

// DMX out through an FT232R style usb-serial (Enttec Open DMX and clones):
// 250k 8N2, break and mark-after-break made by toggling the line break.
class DmxSerial: public Transport {
  public:
  DmxSerial();
  ~DmxSerial();

  void open(const std::string& address) override;
  void send(const FrameData& frame) override;
  void close() override;
  bool isOpen() const override { return ctx != nullptr; }

  static constexpr int baudRate = 250000;
  static constexpr uint32_t breakMicros = 100; // >= 88
  static constexpr uint32_t markMicros = 12;   // >= 8

  private:
  ftdi_context* ctx = nullptr;
  FtdiAddress addr;

  [[noreturn]] void fail(ErrorCode code, const std::string& what, int rc);
  void check(int rc, const char* what); // IoError on rc < 0
};

}
