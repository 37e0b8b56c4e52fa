#pragma once

#include <stdexcept>
#include <string>

namespace fog {

enum class ErrorCode {
  OutOfRange, SafetyViolation, UnknownScene,         // validation
  DeviceNotFound, PermissionDenied, Busy, IoError,   // transport
  Unavailable, InitFailed, ReadFailed,               // input line
  PersistenceFailed
};

inline const char* toString(ErrorCode code) {
  switch(code) {
    case ErrorCode::OutOfRange:        return "OutOfRange";
    case ErrorCode::SafetyViolation:   return "SafetyViolation";
    case ErrorCode::UnknownScene:      return "UnknownScene";
    case ErrorCode::DeviceNotFound:    return "DeviceNotFound";
    case ErrorCode::PermissionDenied:  return "PermissionDenied";
    case ErrorCode::Busy:              return "Busy";
    case ErrorCode::IoError:           return "IoError";
    case ErrorCode::Unavailable:       return "Unavailable";
    case ErrorCode::InitFailed:        return "InitFailed";
    case ErrorCode::ReadFailed:        return "ReadFailed";
    case ErrorCode::PersistenceFailed: return "PersistenceFailed";
  }
  return "Unknown";
}

class Error: public std::runtime_error {
  public:
  Error(ErrorCode code, const std::string& what):
    std::runtime_error(what), _code(code) {}
  ErrorCode code() const { return _code; }
  const char* codeName() const { return toString(_code); }
  private:
  ErrorCode _code;
};

// bad channel/value/scene name/config bounds. always thrown back at the caller
class ValidationError: public Error {
  public:
  using Error::Error;
};

// transport open/send. only ever caught by the output loop
class DeviceError: public Error {
  public:
  using Error::Error;
};

// contact input line. only ever caught by the input monitor
class InputDeviceError: public Error {
  public:
  using Error::Error;
};

class PersistenceError: public Error {
  public:
  explicit PersistenceError(const std::string& what):
    Error(ErrorCode::PersistenceFailed, what) {}
};

}
