#pragma once

#include <cstdint>
#include <string>

#include "util.h"

namespace fog {

using UID = uint32_t;

class Named { // has a name and a type.
  public:
    Named(): Named("") {}
    Named(const std::string& id, const std::string& type = "");
    virtual ~Named() {}
    const std::string& id()   const { return _id; }
    const std::string& type() const { return _type; }
    UID                uid()  const { return _uid; }
    virtual std::string toString() const;
  private:
    std::string _id, _type;
    UID _uid;
};


// something expected to be run continuously. keeps count of attempts vs actual runs,
// flags itself inactive after idleTimeout of failed runs.
class Runnable: public Named {
  public:
    Runnable(const std::string& id, const std::string& type):
      Named(id, type) {
      ts.start = ts.run = Clock::now();
    }
    virtual ~Runnable() {}

    bool run();

    struct TimeStamps { TimePoint start, run{}, attempt{}; } ts;
    struct Counts { uint32_t run = 0, attempt = 0; Clock::duration totalTime{}; } count;

    bool active() const { return _active; }

    std::string toString() const override;

  private:
    bool _active = true;

    void checkAndHandleTimeOut();
    void setActive(bool state = true) { _active = state; }

    virtual bool _run() = 0;
    virtual bool _ready() { return true; }
    virtual void _onTimeout() {}
    virtual void _onRestored() {}

  protected:
    Millis idleTimeout{5000}; // 0 for never
};

}
