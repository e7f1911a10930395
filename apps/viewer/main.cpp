#include <rnk/config.hpp>
#include <rnk/log.hpp>
#include <rnk/viewer/app.hpp>

using namespace rnk;

// Usage: rnk_viewer [session.csv]
int main(int argc, char** argv) {
  SessionConfig cfg;
  if (argc > 1) {
    auto loaded = load_session_config_csv(argv[1]);
    if (!loaded) {
      log_error("cannot open session config '{}'", argv[1]);
      return 1;
    }
    cfg = *loaded;
  }

  ViewerApp app(cfg);
  return app.run();
}
