#include "log.h"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>

namespace fog {

uint64_t LogOutput::millisSinceStart() {
  using namespace std::chrono;
  static const auto start = steady_clock::now();
  return duration_cast<milliseconds>(steady_clock::now() - start).count();
}

bool Log::initOutput(const std::string& output) {
  LogOutput::PrintFn pr;
  if(output == "stderr") {
    pr = [](const std::string& s) { std::cerr << s << std::flush; };
  } else if(output == "stdout") {
    pr = [](const std::string& s) { std::cout << s << std::flush; };
  } else if(!output.empty()) { // anything else is a file we append to
    std::shared_ptr<FILE> file(std::fopen(output.c_str(), "a"), [](FILE* f) { if(f) std::fclose(f); });
    if(file) {
      pr = [file](const std::string& s) {
             std::fputs(s.c_str(), file.get());
             std::fflush(file.get()); };
    }
  }
  if(pr) {
    auto dest = LogOutput(output, pr);
    if(enableColor && output != "stdout" && output.find('/') == std::string::npos) {
      dest.setFmt([](const std::string& loc, const std::string& lvl, const std::string& txt) {
                    return fmt::format("{}\t[{}]\t{}\t{}", LogOutput::millisSinceStart(),
                                       Ansi<Yellow>(lvl), Ansi<Blue>(loc), txt); });
    }
    addOutput(dest);
    ln("Logging started", INFO, output);
  } else {
    ln("Failed to add output", ERROR, output);
  }
  return (bool)pr;
}

void Log::addOutput(const LogOutput& lo) {
  std::lock_guard<std::mutex> lock(guard);
  destinations.push_back(lo);
}

void Log::clearOutputs() {
  std::lock_guard<std::mutex> lock(guard);
  destinations.clear();
}

void Log::log(const std::string& text, const Level level, const std::string& location) const {
  if(!shouldLog(level)) return;
  if(whiteList.size() > 0) { // filter-in active
    bool found = false;
    for(auto& s: whiteList) {
      if(s == location) {
        found = true;
        break;
      }
    }
    if(!found) return;
  } else if(blackList.size() > 0) { // filter out
    for(auto& s: blackList) {
      if(location == s) return;
    }
  }

  std::string lvl = convert(level);
  std::lock_guard<std::mutex> lock(guard);
  for(auto& dest: destinations) { dest.log(location, lvl, text); }
}

void Log::ln(const std::string& text, const Level level, const std::string& location) const {
  log(text + "\n", level, location);
}
void Log::dbg(const std::string& text, const std::string& location) const {
  ln(text, DEBUG, location);
}
void Log::err(const std::string& text, const std::string& location) const {
  ln(text, ERROR, location);
}

bool Log::countCall(uint16_t numCalls, uint8_t id) const {
  std::lock_guard<std::mutex> lock(guard);
  auto& calls = callTracker[id];
  if(++calls < numCalls) return false;
  callTracker.erase(id); // dunno when will be needed next so might as well remove, rather than zero
  return true;
}

Log::Level Log::convert(const std::string& lvl) const {
  for(int8_t ilvl = TRACE; ilvl <= CRITICAL; ilvl++)
    if(lvl == lvlStr[ilvl])
      return (Level)ilvl;
  return INVALID;
}

std::string Log::convert(const Level lvl) const {
  if(lvl >= TRACE && lvl <= CRITICAL) return lvlStr[lvl];
  else return "INVALID";
}


Log lg;
}
