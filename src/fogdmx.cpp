#include "app.h"
#include "log.h"

int main(int /*argc*/, char** /*argv*/) {
  fog::lg.initOutput("stderr");
  fog::App::installSignalHandlers();
  fog::App app{};
  try {
    app.init();
  } catch(const std::exception& e) {
    fog::lg.f("main", fog::Log::CRITICAL, "Startup failed: {}", e.what());
    return 1;
  }
  return app.run();
}
