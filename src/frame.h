#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "base.h"

namespace fog {

constexpr uint16_t kUniverseSize   = 512;
constexpr uint16_t kFixtureChannels = 16;  // the one profile we drive, 16-channel mode
constexpr uint16_t kSafetyChannel  = 16;   // fixture ignores everything unless this is 50-200
constexpr uint8_t  kSafetyMin      = 50;
constexpr uint8_t  kSafetyMax      = 200;
constexpr uint8_t  kSafetyDefault  = 100;

inline bool validSafetyValue(int value) { return value >= kSafetyMin && value <= kSafetyMax; }

struct Scene;

// DMX universe as it goes on the wire: slot 0 is the start code, 1-512 the channels.
using FrameData = std::array<uint8_t, kUniverseSize + 1>;

// The 512 channel state. Not locked itself, the controller owns the only
// instance and serializes access to it.
class ChannelFrame: public Named {
  public:
    ChannelFrame(const std::string& id = "frame");

    // throws ValidationError: OutOfRange for channel/value, SafetyViolation for bad ch16
    void set(int channel, int value);
    static void validate(int channel, int value, int lastChannel = kUniverseSize);
    uint8_t get(uint16_t channel) const;

    // replaces channels 1-16 wholesale, correcting an invalid safety value to 100
    void apply(const Scene& scene);
    // zeros everything except safety which goes to 100, so fixture stays listening
    void blackout();

    const FrameData& data() const { return _data; }

  private:
    FrameData _data{};
};

}
