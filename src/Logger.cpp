#include "emulator-server/Logger.hpp"

namespace emuserver {

// Out-of-line so every translation unit shares one instance
ServerLogger &ServerLogger::instance() {
  static ServerLogger logger;
  return logger;
}

} // namespace emuserver
