#include "scheduler_runtime.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace gpusched {

auto
build_device_inventory(const RuntimeConfig& cfg) -> std::vector<Device>
{
  std::vector<Device> devices;
  if (cfg.discover_devices) {
    devices = discover_nvml_devices();
    if (devices.empty()) {
      log_warning("NVML discovery found no GPU; using configured devices");
    }
  }
  if (devices.empty()) {
    for (const auto& entry : cfg.devices) {
      Device device;
      device.id = entry.id;
      device.name = entry.name;
      device.total_vram = entry.total_vram_mib * kBytesPerMiB;
      device.nvlink_peers.insert(
          entry.nvlink_peers.begin(), entry.nvlink_peers.end());
      devices.push_back(std::move(device));
    }
  }
  if (devices.empty()) {
    throw ConfigurationException("No GPU device configured or discovered");
  }
  return devices;
}

auto
make_scheduler_options(const RuntimeConfig& cfg) -> SchedulerOptions
{
  SchedulerOptions options;
  options.max_admission_attempts = cfg.scheduler.max_admission_attempts;
  options.drain_skip_limit = cfg.scheduler.drain_skip_limit;
  options.queue_timeout = std::chrono::seconds(cfg.scheduler.queue_timeout_s);
  options.finished_job_retention = cfg.scheduler.finished_job_retention;
  options.verbosity = cfg.verbosity;
  return options;
}

auto
make_health_policy(const RuntimeConfig& cfg) -> HealthPolicy
{
  HealthPolicy policy;
  policy.interval = std::chrono::milliseconds(cfg.health.interval_ms);
  policy.temperature_limit_c = cfg.health.temperature_limit_c;
  policy.error_threshold = cfg.health.error_threshold;
  policy.error_window = std::chrono::seconds(cfg.health.error_window_s);
  policy.recovery_sweeps = cfg.health.recovery_sweeps;
  policy.utilization_warning_pct = cfg.health.utilization_warning_pct;
  policy.memory_warning_pct = cfg.health.memory_warning_pct;
  return policy;
}

auto
make_tier_capacities(const RuntimeConfig& cfg) -> TierCapacities
{
  return TierCapacities{
      cfg.scheduler.realtime_capacity, cfg.scheduler.high_capacity,
      cfg.scheduler.normal_capacity, cfg.scheduler.batch_capacity};
}

namespace {
auto
make_rebalance_policy(const RuntimeConfig& cfg) -> RebalancePolicy
{
  RebalancePolicy policy;
  policy.interval = std::chrono::seconds(cfg.rebalance.interval_s);
  policy.deviation_ratio = cfg.rebalance.deviation_ratio;
  policy.evict_idle_models = cfg.rebalance.evict_idle_models;
  return policy;
}
}  // namespace

SchedulerRuntime::SchedulerRuntime(
    const RuntimeConfig& cfg, DeviceSampleProvider telemetry, ClockFn clock)
    : SchedulerRuntime(
          cfg, build_device_inventory(cfg), std::move(telemetry),
          std::move(clock))
{
}

SchedulerRuntime::SchedulerRuntime(
    const RuntimeConfig& cfg, std::vector<Device> devices,
    DeviceSampleProvider telemetry, ClockFn clock)
    : cfg_(cfg), registry_(std::move(devices), cfg.verbosity),
      ledger_(
          registry_, cfg.scheduler.memory_headroom_mib * kBytesPerMiB,
          cfg.verbosity, clock),
      optimizer_(ledger_, cfg.verbosity, clock),
      queue_(make_tier_capacities(cfg)),
      estimator_(
          cfg.estimator.image_mib * kBytesPerMiB,
          cfg.estimator.video_mib * kBytesPerMiB,
          cfg.estimator.speech_mib * kBytesPerMiB),
      scheduler_(
          registry_, ledger_, optimizer_, queue_, estimator_,
          make_scheduler_options(cfg), clock),
      health_(registry_, make_health_policy(cfg), cfg.verbosity, clock),
      balancer_(
          registry_, ledger_, optimizer_, make_rebalance_policy(cfg),
          cfg.verbosity),
      collector_(
          registry_, std::move(telemetry),
          std::chrono::milliseconds(cfg.telemetry.interval_ms), cfg.verbosity),
      timeout_task_(
          "queue timeout sweep",
          std::chrono::milliseconds(cfg.scheduler.timeout_sweep_ms),
          [this] { scheduler_.sweep(); }, cfg.verbosity)
{
}

SchedulerRuntime::~SchedulerRuntime()
{
  stop();
}

auto
SchedulerRuntime::preload_models() -> std::size_t
{
  std::size_t loaded = 0;
  for (const auto& device : cfg_.devices) {
    if (!registry_.contains(device.id)) {
      log_warning(
          "Skipping resident models of GPU " + std::to_string(device.id) +
          ": not part of the inventory");
      continue;
    }
    for (const auto& model : device.resident_models) {
      try {
        optimizer_.load_model(
            device.id, model.name, model.vram_mib * kBytesPerMiB,
            model.baseline);
        ++loaded;
      }
      catch (const InsufficientCapacityException& e) {
        log_error(
            "Cannot preload " + model.name + " on GPU " +
            std::to_string(device.id) + ": " + e.what());
      }
    }
  }
  return loaded;
}

void
SchedulerRuntime::start()
{
  stopped_ = false;
  if (cfg_.telemetry.enabled) {
    collector_.collect_once();
    collector_.start();
  }
  health_.start();
  timeout_task_.start();
  if (cfg_.rebalance.enabled) {
    balancer_.start();
  }
  log_info(
      cfg_.verbosity, "Scheduler runtime started with " +
                          std::to_string(registry_.size()) + " GPU(s)");
}

void
SchedulerRuntime::stop()
{
  if (stopped_) {
    return;
  }
  stopped_ = true;
  balancer_.stop();
  timeout_task_.stop();
  health_.stop();
  collector_.stop();
  scheduler_.shutdown();
}

}  // namespace gpusched
