#include "frame.h"

#include <algorithm>

#include "error.h"
#include "scene.h"

namespace fog {

ChannelFrame::ChannelFrame(const std::string& id):
  Named(id, "frame") {
  _data[kSafetyChannel] = kSafetyDefault;
}

void ChannelFrame::validate(int channel, int value, int lastChannel) {
  if(channel < 1 || channel > lastChannel)
    throw ValidationError(ErrorCode::OutOfRange,
                          "channel " + std::to_string(channel) + " not in 1-" + std::to_string(lastChannel));
  if(value < 0 || value > 255)
    throw ValidationError(ErrorCode::OutOfRange, "value " + std::to_string(value) + " not in 0-255");
  if(channel == kSafetyChannel && !validSafetyValue(value))
    throw ValidationError(ErrorCode::SafetyViolation,
                          "safety channel must be between 50 and 200, got " + std::to_string(value));
}

void ChannelFrame::set(int channel, int value) {
  validate(channel, value);
  _data[channel] = (uint8_t)value;
}

uint8_t ChannelFrame::get(uint16_t channel) const {
  if(channel < 1 || channel > kUniverseSize)
    throw ValidationError(ErrorCode::OutOfRange, "channel " + std::to_string(channel) + " not in 1-512");
  return _data[channel];
}

void ChannelFrame::apply(const Scene& scene) {
  std::copy(scene.values.begin(), scene.values.end(), _data.begin() + 1);
  if(!validSafetyValue(_data[kSafetyChannel]))
    _data[kSafetyChannel] = kSafetyDefault;
}

void ChannelFrame::blackout() {
  _data.fill(0);
  _data[kSafetyChannel] = kSafetyDefault;
}

}
