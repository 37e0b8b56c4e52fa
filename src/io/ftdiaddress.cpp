#include "io/ftdiaddress.h"

#include <stdexcept>

#include <fmt/format.h>

#include "error.h"
#include "util.h"

namespace fog {

namespace {
uint16_t parseId(const std::string& part, bool vendor) {
  auto p = util::toLower(part);
  if(vendor && (p.empty() || p == "ftdi")) return 0x0403;
  if(!vendor) {
    if(p.empty() || p == "232" || p == "232r" || p == "ft232r") return 0x6001;
    if(p == "2232" || p == "ft2232") return 0x6010;
    if(p == "4232" || p == "ft4232") return 0x6011;
    if(p == "232h" || p == "ft232h") return 0x6014;
  }
  size_t pos = 0;
  unsigned long id = std::stoul(p, &pos, 16);
  if(pos != p.size() || id > 0xFFFF) throw std::invalid_argument(part);
  return (uint16_t)id;
}
}

FtdiAddress FtdiAddress::parse(const std::string& address) {
  FtdiAddress a;
  auto trimmed = util::trim(address);
  if(trimmed.empty() || util::toLower(trimmed) == "auto") return a;

  const std::string scheme = "ftdi://";
  if(trimmed.rfind(scheme, 0) != 0)
    throw DeviceError(ErrorCode::DeviceNotFound, "not an ftdi:// address: " + address);
  try {
    auto rest = trimmed.substr(scheme.size());
    auto slash = rest.find('/');
    auto device = rest.substr(0, slash);
    if(slash != std::string::npos && slash + 1 < rest.size()) {
      int iface = util::toInt(rest.substr(slash + 1));
      if(iface < 1 || iface > 4) throw std::invalid_argument("interface");
      a.interface = (uint8_t)iface;
    }
    auto parts = util::split(device, ':');
    if(parts.size() > 0) a.vendor = parseId(parts[0], true);
    if(parts.size() > 1) a.product = parseId(parts[1], false);
    if(parts.size() > 2) a.serial = parts[2];
  } catch(const std::logic_error&) { // invalid_argument, out_of_range
    throw DeviceError(ErrorCode::DeviceNotFound, "bad ftdi address: " + address);
  }
  return a;
}

std::string FtdiAddress::toString() const {
  return fmt::format("ftdi://{:04x}:{:04x}{}{}/{}", vendor, product,
                     serial.empty()? "": ":", serial, interface);
}

}
