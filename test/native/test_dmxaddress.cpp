#ifdef UNIT_TEST

#include <unity.h>

#include "fakes.h"
#include "io/dmxserial.h"

using namespace fog;
using fog::test::expectThrows;

void setUp() {}
void tearDown() {}

void test_default_url() {
  auto a = FtdiAddress::parse("ftdi://0403:6001/1");
  TEST_ASSERT_EQUAL_HEX16(0x0403, a.vendor);
  TEST_ASSERT_EQUAL_HEX16(0x6001, a.product);
  TEST_ASSERT_EQUAL(1, a.interface);
  TEST_ASSERT_TRUE(a.serial.empty());
  TEST_ASSERT_EQUAL_STRING("ftdi://0403:6001/1", a.toString().c_str());
}

void test_auto() {
  auto a = FtdiAddress::parse("auto");
  TEST_ASSERT_EQUAL_HEX16(0x0403, a.vendor);
  TEST_ASSERT_EQUAL_HEX16(0x6001, a.product);
}

void test_aliases_and_serial() {
  auto a = FtdiAddress::parse("ftdi://ftdi:232h:FT1234/2");
  TEST_ASSERT_EQUAL_HEX16(0x0403, a.vendor);
  TEST_ASSERT_EQUAL_HEX16(0x6014, a.product);
  TEST_ASSERT_EQUAL_STRING("FT1234", a.serial.c_str());
  TEST_ASSERT_EQUAL(2, a.interface);
}

void test_garbage_is_device_not_found() {
  expectThrows<DeviceError>([] { FtdiAddress::parse("/dev/ttyUSB0"); }, ErrorCode::DeviceNotFound, "path");
  expectThrows<DeviceError>([] { FtdiAddress::parse("ftdi://zzzz:6001/1"); }, ErrorCode::DeviceNotFound, "vendor");
  expectThrows<DeviceError>([] { FtdiAddress::parse("ftdi://0403:6001/9"); }, ErrorCode::DeviceNotFound, "iface");
}

void test_closed_transport_refuses_send() {
  DmxSerial dmx;
  TEST_ASSERT_FALSE(dmx.isOpen());
  dmx.close(); // harmless
  expectThrows<DeviceError>([&] { dmx.send(FrameData{}); }, ErrorCode::IoError, "send while closed");
}

int main(int argc, char **argv) {
  UNITY_BEGIN();

  RUN_TEST(test_default_url);
  RUN_TEST(test_auto);
  RUN_TEST(test_aliases_and_serial);
  RUN_TEST(test_garbage_is_device_not_found);
  RUN_TEST(test_closed_transport_refuses_send);

  return UNITY_END();
}

#endif
