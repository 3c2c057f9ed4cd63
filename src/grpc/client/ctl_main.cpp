#include <grpcpp/grpcpp.h>

#include <span>
#include <vector>

#include "ctl_args.hpp"
#include "scheduler_client.hpp"
#include "utils/logger.hpp"

auto
main(int argc, char* argv[]) -> int
{
  std::vector<const char*> const_argv(argv, argv + argc);
  std::span<const char*> args{const_argv};
  const gpusched::CtlConfig config = gpusched::parse_ctl_args(args);
  if (config.show_help) {
    gpusched::display_ctl_help(args.front());
    return 0;
  }
  if (!config.valid) {
    gpusched::log_error("Invalid program options.");
    return 1;
  }

  auto channel = grpc::CreateChannel(
      config.server_address, grpc::InsecureChannelCredentials());
  gpusched::SchedulerClient client(channel, config.verbosity);

  if (!client.ServerIsLive()) {
    return 1;
  }
  return client.Run(config) ? 0 : 1;
}
