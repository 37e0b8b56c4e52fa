#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "base.h"
#include "scene.h"

namespace fog {

// everything that survives a restart
struct PersistedState {
  Scenes scenes = defaultScenes();
  double duration = 10.0;
};

class Config;

// something that keeps PersistedState somewhere. a file for now.
class Store: public Named {
  public:
  Store(const std::string& id): Named(id, "store") {}
  virtual ~Store() {}

  // never throws: missing or broken data comes back as defaults
  virtual PersistedState load() = 0;
  // throws PersistenceError
  virtual void save(const PersistedState& state) = 0;
};


// {"scene_b_duration": 10.0, "scenes": {"scene_a": {"name": "...", "channels": {"1": 0, ...}}, ...}}
class JsonFileStore: public Store {
  public:
  JsonFileStore(const std::string& path, const Config& cfg);

  PersistedState load() override;
  void save(const PersistedState& state) override;

  const std::string& path() const { return _path; }

  // exposed for tests and the console
  nlohmann::json toJson(const PersistedState& state) const;
  PersistedState fromJson(const nlohmann::json& doc) const;

  private:
  std::string _path;
  const Config& cfg;
};

}
