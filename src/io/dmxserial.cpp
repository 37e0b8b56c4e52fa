#include "io/dmxserial.h"

#include <thread>

#include <ftdi.h>

#include "log.h"
#include "util.h"

namespace fog {

DmxSerial::DmxSerial(): Transport("DMX serial", "ftdi") {}

DmxSerial::~DmxSerial() { close(); }

void DmxSerial::fail(ErrorCode code, const std::string& what, int rc) {
  std::string reason = ctx? ftdi_get_error_string(ctx): "no context";
  close();
  throw DeviceError(code, fmt::format("{} ({}): {}", what, rc, reason));
}

void DmxSerial::check(int rc, const char* what) {
  if(rc < 0) fail(ErrorCode::IoError, what, rc);
}

void DmxSerial::open(const std::string& address) {
  close();
  addr = FtdiAddress::parse(address);

  ctx = ftdi_new();
  if(!ctx) throw DeviceError(ErrorCode::IoError, "ftdi_new failed");

  check(ftdi_set_interface(ctx, static_cast<ftdi_interface>(INTERFACE_A + addr.interface - 1)),
        "select interface");

  int rc = ftdi_usb_open_desc_index(ctx, addr.vendor, addr.product, nullptr,
                                    addr.serial.empty()? nullptr: addr.serial.c_str(), addr.index);
  switch(rc) {
    case 0: break;
    case -3: fail(ErrorCode::DeviceNotFound, "no adapter at " + addr.toString(), rc);
    case -4: fail(ErrorCode::PermissionDenied, "can't open " + addr.toString(), rc);
    case -5: fail(ErrorCode::Busy, addr.toString() + " is claimed by something else", rc);
    default: fail(ErrorCode::IoError, "opening " + addr.toString(), rc);
  }

  check(ftdi_usb_reset(ctx), "reset");
  check(ftdi_set_baudrate(ctx, baudRate), "set baudrate");
  check(ftdi_set_line_property(ctx, BITS_8, STOP_BIT_2, NONE), "set 8N2");
  check(ftdi_setflowctrl(ctx, SIO_DISABLE_FLOW_CTRL), "disable flow control");
  check(ftdi_set_latency_timer(ctx, 1), "set latency");

  lg.f("DmxSerial", Log::INFO, "Opened {}", addr.toString());
}

void DmxSerial::send(const FrameData& frame) {
  if(!ctx) throw DeviceError(ErrorCode::IoError, "not open");

  check(ftdi_set_line_property2(ctx, BITS_8, STOP_BIT_2, NONE, BREAK_ON), "break on");
  std::this_thread::sleep_for(std::chrono::microseconds(breakMicros));
  check(ftdi_set_line_property2(ctx, BITS_8, STOP_BIT_2, NONE, BREAK_OFF), "break off");
  std::this_thread::sleep_for(std::chrono::microseconds(markMicros));

  int written = ftdi_write_data(ctx, frame.data(), (int)frame.size());
  if(written < 0) fail(ErrorCode::IoError, "write", written);
  if(written != (int)frame.size())
    fail(ErrorCode::IoError, fmt::format("short write, {} of {} bytes", written, frame.size()), written);
}

void DmxSerial::close() {
  if(!ctx) return;
  ftdi_usb_close(ctx); // nothing to do about a failed close
  ftdi_free(ctx);
  ctx = nullptr;
}


std::unique_ptr<Transport> makeTransport(const std::string& address) {
  FtdiAddress::parse(address); // throws on garbage before we hand anything out
  return std::make_unique<DmxSerial>();
}

}
