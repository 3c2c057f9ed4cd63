#include "signal_handler.hpp"

namespace gpusched {

auto
server_context() -> ServerContext&
{
  static ServerContext ctx;
  return ctx;
}

// Only touches a lock-free atomic; the notifier thread wakes the main loop.
void
signal_handler(int /*signal*/)
{
  server_context().stop_requested.store(true);
}

}  // namespace gpusched
