#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include "core/scheduler_runtime.hpp"
#include "monitoring/metrics.hpp"
#include "scheduler_service.hpp"
#include "signal_handler.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace gpusched {

auto
handle_program_arguments(std::span<char const* const> args) -> RuntimeConfig
{
  const char* config_path = nullptr;

  auto remaining = args.subspan(1);
  auto require_value = [&](std::string_view flag) {
    if (remaining.empty() || remaining.front() == nullptr) {
      log_fatal("Missing value for " + std::string(flag) + " argument.\n");
    }
    const char* value = remaining.front();
    remaining = remaining.subspan(1);
    return value;
  };

  while (!remaining.empty()) {
    const char* raw_arg = remaining.front();
    remaining = remaining.subspan(1);

    if (raw_arg == nullptr) {
      log_fatal("Unexpected null program argument.\n");
    }

    std::string_view arg{raw_arg};
    if (arg == "--config" || arg == "-c") {
      config_path = require_value(arg);
      continue;
    }
    log_fatal(
        "Unknown argument '" + std::string(arg) +
        "'. Only --config/-c is supported; all other settings must live in "
        "the YAML file.\n");
  }

  if (config_path == nullptr) {
    log_fatal("Missing required --config argument.\n");
  }

  RuntimeConfig cfg = load_config(config_path);
  cfg.config_path = config_path;

  if (!cfg.valid) {
    log_fatal("Invalid configuration file.\n");
  }

  log_info(cfg.verbosity, "__cplusplus = " + std::to_string(__cplusplus));
  if (!cfg.name.empty()) {
    log_info(cfg.verbosity, "Configuration   : " + cfg.name);
  }
  log_info(cfg.verbosity, "Listen address  : " + cfg.server_address);

  return cfg;
}

void
log_device_inventory(SchedulerRuntime& runtime, VerbosityLevel verbosity)
{
  for (const auto& device : runtime.scheduler().device_table()) {
    log_info(
        verbosity, "GPU " + std::to_string(device.id) + " (" + device.name +
                       "): " + std::to_string(device.total_vram / kBytesPerMiB) +
                       " MiB total, " +
                       std::to_string(device.free_vram / kBytesPerMiB) +
                       " MiB free");
  }
}

void
launch_threads(const RuntimeConfig& cfg, SchedulerRuntime& runtime)
{
  auto& server_ctx = server_context();

  std::jthread notifier_thread([&server_ctx]() {
    constexpr auto kNotifierSleep = std::chrono::milliseconds(10);
    while (!server_ctx.stop_requested.load(std::memory_order_relaxed)) {
      std::this_thread::sleep_for(kNotifierSleep);
    }
    server_ctx.stop_cv.notify_one();
  });

  std::jthread grpc_thread([&]() {
    const auto server_options =
        GrpcServerOptions{cfg.server_address, cfg.verbosity};
    RunGrpcServer(runtime, server_options, server_ctx.server);
  });

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  {
    std::unique_lock lock(server_ctx.stop_mutex);
    server_ctx.stop_cv.wait(
        lock, [] { return server_context().stop_requested.load(); });
  }
  log_info(cfg.verbosity, "Shutdown requested");
  StopServer(server_ctx.server.get());
}

}  // namespace gpusched

auto
main(int argc, char* argv[]) -> int
{
  try {
    gpusched::RuntimeConfig cfg = gpusched::handle_program_arguments(
        {argv, static_cast<size_t>(argc)});
    const bool metrics_ok = gpusched::init_metrics(cfg.metrics_port);
    if (!metrics_ok) {
      gpusched::log_warning(
          "Metrics server failed to start; continuing without metrics.");
    }
    {
      gpusched::SchedulerRuntime runtime(cfg);
      const auto preloaded = runtime.preload_models();
      gpusched::log_info(
          cfg.verbosity,
          "Preloaded " + std::to_string(preloaded) + " resident model(s)");
      gpusched::log_device_inventory(runtime, cfg.verbosity);
      runtime.start();
      gpusched::launch_threads(cfg, runtime);
      runtime.stop();
    }
    gpusched::shutdown_metrics();
  }
  catch (const gpusched::GpuSchedulerException& e) {
    std::cerr << "\o{33}[1;31m[Scheduler Error] " << e.what() << "\o{33}[0m\n";
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "\o{33}[1;31m[General Error] " << e.what() << "\o{33}[0m\n";
    return -1;
  }

  return 0;
}
