#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace fog {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

namespace util {

inline double secondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

inline Clock::duration fromSeconds(double seconds) {
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::vector<std::string> split(const std::string& text, char delim);
std::vector<std::string> splitWhitespace(const std::string& text);

std::string toLower(std::string value);
std::string trim(const std::string& str);

// getenv, but empty if not set
std::string env(const char* name);

// parses the whole string or throws std::invalid_argument
int toInt(const std::string& str);
double toDouble(const std::string& str);

} // util

}
