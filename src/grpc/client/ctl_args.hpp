#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "utils/logger.hpp"

namespace gpusched {

enum class CtlCommand : std::uint8_t {
  None,
  Devices,
  Queues,
  Status,
  Cancel,
  ForceRelease,
  Quarantine,
  Restore
};

struct CtlConfig {
  CtlCommand command = CtlCommand::None;
  std::string job_id;
  int device_id = -1;
  std::string reason;
  std::string server_address = "localhost:50051";
  VerbosityLevel verbosity = VerbosityLevel::Info;
  bool show_help = false;
  bool valid = true;
};

void display_ctl_help(const char* prog_name);
auto parse_ctl_args(std::span<const char*> args) -> CtlConfig;
}  // namespace gpusched
