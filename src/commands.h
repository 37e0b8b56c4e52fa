#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.h"
#include "log.h"
#include "util.h"

namespace fog {

// args are whatever followed the command, split on whitespace. returns what to print.
using command_t = std::function<nlohmann::json(const std::vector<std::string>& args)>;

// parse strings n call stuff. errors come back as {"error": ..., "code": ...} rather than throwing,
// whoever typed the line gets told and nothing else cares.
class CommandRunner {
  public:
  CommandRunner() {}
  ~CommandRunner() {}

  void add(const std::string& id, const std::string& help, command_t command) {
    cmds[id] = {help, std::move(command)};
  }

  nlohmann::json execute(const std::string& id, const std::vector<std::string>& args) const {
    auto it = cmds.find(util::toLower(id));
    if(it == cmds.end()) {
      lg.f("CommandRunner", Log::DEBUG, "Command not found {}", id);
      return {{"error", "unknown command '" + id + "', try help"}, {"code", "UnknownCommand"}};
    }
    try {
      return it->second.fn(args);
    } catch(const Error& e) {
      return {{"error", e.what()}, {"code", e.codeName()}};
    } catch(const std::logic_error& e) { // number parsing
      return {{"error", std::string("bad argument: ") + e.what()}, {"code", "BadArgument"}};
    }
  }

  // "scene b" -> execute("scene", {"b"}). blank lines give null
  nlohmann::json line(const std::string& text) const {
    auto words = util::splitWhitespace(text);
    if(words.empty()) return nullptr;
    std::string id = words.front();
    words.erase(words.begin());
    return execute(id, words);
  }

  nlohmann::json help() const {
    nlohmann::json out = nlohmann::json::object();
    for(auto& [id, cmd]: cmds) out[id] = cmd.help;
    return out;
  }

  private:
  struct Command {
    std::string help;
    command_t fn;
  };
  std::map<std::string, Command> cmds;
};

}
