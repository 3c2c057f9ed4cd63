#include "ctl_args.hpp"

#include <cstddef>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"

namespace gpusched {
namespace {

struct CommandSpec {
  CtlCommand command;
  // Name of the positional argument the command takes, empty for none.
  std::string_view operand;
};

auto
command_table()
    -> const std::unordered_map<
        std::string, CommandSpec, TransparentHash, std::equal_to<>>&
{
  static const std::unordered_map<
      std::string, CommandSpec, TransparentHash, std::equal_to<>>
      table = {
          {"devices", {CtlCommand::Devices, ""}},
          {"queues", {CtlCommand::Queues, ""}},
          {"status", {CtlCommand::Status, "JOB_ID"}},
          {"cancel", {CtlCommand::Cancel, "JOB_ID"}},
          {"force-release", {CtlCommand::ForceRelease, "JOB_ID"}},
          {"quarantine", {CtlCommand::Quarantine, "GPU"}},
          {"restore", {CtlCommand::Restore, "GPU"}},
      };
  return table;
}

auto
takes_device(CtlCommand command) -> bool
{
  return command == CtlCommand::Quarantine || command == CtlCommand::Restore;
}

auto
parse_device_id(const std::string& value) -> int
{
  std::size_t consumed = 0;
  const int device_id = std::stoi(value, &consumed);
  if (consumed != value.size() || device_id < 0) {
    throw std::invalid_argument("GPU id must be a non-negative integer");
  }
  return device_id;
}

}  // namespace

void
display_ctl_help(const char* prog_name)
{
  std::cout
      << "Usage: " << prog_name << " [OPTIONS] COMMAND [ARG]\n"
      << "Commands:\n"
      << "  devices               Show the device table\n"
      << "  queues                Show queued and active jobs per tier\n"
      << "  status JOB_ID         Show one job\n"
      << "  cancel JOB_ID         Cancel a queued or running job\n"
      << "  force-release JOB_ID  Drop a stuck reservation\n"
      << "  quarantine GPU        Take a GPU out of service\n"
      << "  restore GPU           Put a quarantined GPU back\n"
      << "Options:\n"
      << "  --server ADDR     gRPC server address (default: localhost:50051)\n"
      << "  --reason TEXT     Reason recorded with quarantine\n"
      << "  --verbose [0-4]   Verbosity level: 0=silent to 4=trace\n"
      << "  --help            Show this help message\n";
}

// =============================================================================
// Option parsers
// =============================================================================

template <typename Func>
auto
try_parse(const char* val, Func&& parser) -> bool
{
  try {
    std::forward<Func>(parser)(val);
    return true;
  }
  catch (const std::invalid_argument& e) {
    log_error(std::string("Invalid value: ") + e.what());
    return false;
  }
  catch (const std::out_of_range& e) {
    log_error(std::string("Value out of range: ") + e.what());
    return false;
  }
}

template <typename Func>
auto
expect_and_parse(std::size_t& idx, std::span<const char*> args, Func&& parser)
    -> bool
{
  if (idx + 1 >= args.size()) {
    log_error(std::string("Missing value for ") + args[idx]);
    return false;
  }
  ++idx;
  return try_parse(args[idx], std::forward<Func>(parser));
}

auto
parse_server(CtlConfig& cfg, std::size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(
      idx, args, [&cfg](const char* val) { cfg.server_address = val; });
}

auto
parse_reason(CtlConfig& cfg, std::size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(
      idx, args, [&cfg](const char* val) { cfg.reason = val; });
}

auto
parse_verbose(CtlConfig& cfg, std::size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    cfg.verbosity = parse_verbosity_level(val);
  });
}

// =============================================================================
// Main parser loop: options anywhere, then COMMAND [ARG] positionally
// =============================================================================

auto
parse_argument_values(
    std::span<const char*> args_span, CtlConfig& cfg,
    std::vector<std::string>& positional) -> bool
{
  static const std::unordered_map<
      std::string, bool (*)(CtlConfig&, std::size_t&, std::span<const char*>),
      TransparentHash, std::equal_to<>>
      dispatch = {
          {"--server", parse_server},
          {"--reason", parse_reason},
          {"--verbose", parse_verbose},
      };

  for (std::size_t idx = 1; idx < args_span.size(); ++idx) {
    const std::string arg = args_span[idx];

    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
      return true;
    }

    if (auto iter = dispatch.find(arg); iter != dispatch.end()) {
      if (!iter->second(cfg, idx, args_span)) {
        return false;
      }
      continue;
    }

    if (arg.starts_with("--")) {
      log_error(
          "Unknown argument: " + arg + ". Use --help to see valid options.");
      return false;
    }
    positional.push_back(arg);
  }

  return true;
}

auto
validate_config(CtlConfig& cfg, const std::vector<std::string>& positional)
    -> void
{
  if (positional.empty()) {
    log_error("A command is required.");
    cfg.valid = false;
    return;
  }

  const auto iter = command_table().find(positional.front());
  if (iter == command_table().end()) {
    log_error("Unknown command: " + positional.front());
    cfg.valid = false;
    return;
  }
  const auto& entry = iter->second;
  cfg.command = entry.command;

  const std::size_t expected = entry.operand.empty() ? 1 : 2;
  if (positional.size() != expected) {
    log_error(
        "Command " + positional.front() +
        (entry.operand.empty() ? " takes no argument."
                              : " requires " + std::string(entry.operand) +
                                    "."));
    cfg.valid = false;
    return;
  }
  if (entry.operand.empty()) {
    return;
  }

  const auto& operand = positional[1];
  if (takes_device(entry.command)) {
    cfg.valid = try_parse(operand.c_str(), [&cfg](const char* val) {
      cfg.device_id = parse_device_id(val);
    });
  } else {
    cfg.job_id = operand;
  }
}

auto
parse_ctl_args(const std::span<const char*> args) -> CtlConfig
{
  CtlConfig cfg;
  std::vector<std::string> positional;

  if (!parse_argument_values(args, cfg, positional)) {
    cfg.valid = false;
    return cfg;
  }

  if (!cfg.show_help) {
    validate_config(cfg, positional);
  }

  return cfg;
}
}  // namespace gpusched
