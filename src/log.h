#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace fog {

enum AnsiColor: int {
    Black=30, Red, Green, Yellow, Blue, Magenta, Cyan, White,
    brBlack=90, brRed, brGreen, brYellow, brBlue, brMagenta, brCyan, brWhite
};

template<AnsiColor color, typename T>
std::string Ansi(const T& value) {
    return (std::string)"\033[1;" + std::to_string(static_cast<int>(color)) + "m" + value + "\033[0m";
}

#define __LOC__ (std::string)__func__ + " " + __FILE__ + ":" + std::to_string(__LINE__)
#define TRACE(s) fog::lg.ln(s, fog::Log::TRACE, __LOC__)
#define DEBUG(s) fog::lg.ln(s, fog::Log::DEBUG, __func__)
#define DEBUGF(s, ...) fog::lg.f(__func__, fog::Log::DEBUG, s, __VA_ARGS__)
#define WARN(s) fog::lg.ln(s, fog::Log::WARNING, __func__)
#define ERROR(s) fog::lg.ln(s, fog::Log::ERROR, __LOC__)
#define LOG(s) fog::lg.ln(s, fog::Log::INFO, __func__)


// a destination. what it prints to is up to printFn, fmt decides the line layout
class LogOutput {
  public:
  using FmtFn = std::function<std::string(const std::string&, const std::string&, const std::string&)>;
  using PrintFn = std::function<void(const std::string&)>;

  LogOutput(const std::string& id, PrintFn printFn, bool enabled = true):
    id(id), printFn(std::move(printFn)), enabled(enabled) {}

  std::string id;
  PrintFn printFn;
  bool enabled;

  void log(const std::string& location, const std::string& level, const std::string& text) const {
    if(enabled) log(fmtFn(location, level, text));
  }
  void log(const std::string& text) const {
    if(enabled && printFn) printFn(text);
  }
  void setFmt(FmtFn fn) { fmtFn = std::move(fn); }

  static uint64_t millisSinceStart();

  private:
  FmtFn fmtFn = [](const std::string& loc, const std::string& lvl, const std::string& txt) {
                  return fmt::format("{}\t[{}]\t{}\t{}", millisSinceStart(), lvl, loc, txt); };
};


class Log { // routes to multiple/different destinations...
public:
	enum Level: int8_t { INVALID = -1, TRACE = 0, DEBUG, INFO, WARNING, ERROR, CRITICAL };

  bool initOutput(const std::string& output); // init a predefined: "stderr", "stdout", or a file path
  void addOutput(const LogOutput& lo);
  void clearOutputs();

	void log(const std::string& text, const Level level = INFO, const std::string& location = "") const;
  template<Level lvl>
	void log(const std::string& text, const std::string& location = "") const {
    log(text, lvl, location);
  }

  void ln(const std::string& text, const Level level, const std::string& location) const;
  void dbg(const std::string& text, const std::string& location = "") const;
  void err(const std::string& text, const std::string& location = "") const;

  template<class... Args>
	void f(const std::string& location, const Level level, fmt::format_string<Args...> format, Args&&... args) const {
    if(!shouldLog(level)) return;
    ln(fmt::format(format, std::forward<Args>(args)...), level, location);
  }

  // only outputs every numCalls call for a given id. for stuff going off at frame rate
  template<class... Args>
	void fEvery(uint16_t numCalls, uint8_t id, const std::string& location, const Level level,
              fmt::format_string<Args...> format, Args&&... args) const {
    if(!shouldLog(level) || !countCall(numCalls, id)) return;
    ln(fmt::format(format, std::forward<Args>(args)...), level, location);
  }

	void setLevel(Level lvl) { if(lvl >= TRACE && lvl <= CRITICAL) _level = lvl; }
  Level level() const { return _level; }
	Level convert(const std::string& lvl) const;
	std::string convert(const Level lvl) const;

  void whiteListed(const std::string& location) { whiteList.push_back(location); }
  void blackListed(const std::string& location) { blackList.push_back(location); }

  bool enableColor = false;

private:
	Level _level = INFO;
  std::vector<LogOutput> destinations;
  mutable std::mutex guard;
  mutable std::map<uint8_t, uint16_t> callTracker;

  std::string lvlStr[CRITICAL+1] = {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
  std::vector<std::string> whiteList, blackList; // control which locations

	bool shouldLog(Level lvl) const { return ((int8_t)lvl >= (int8_t)_level); }
  bool countCall(uint16_t numCalls, uint8_t id) const;
};

extern Log lg;

}
