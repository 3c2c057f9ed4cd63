#pragma once

#include <memory>
#include <vector>

#include "allocation_ledger.hpp"
#include "device_registry.hpp"
#include "health_monitor.hpp"
#include "job_queue.hpp"
#include "monitoring/metrics_collector.hpp"
#include "periodic_task.hpp"
#include "scheduler.hpp"
#include "utils/runtime_config.hpp"
#include "vram_balancer.hpp"
#include "vram_estimator.hpp"
#include "vram_optimizer.hpp"

namespace gpusched {

// Builds the device inventory from the configuration (or NVML discovery).
// Throws ConfigurationException when no usable device is found.
auto build_device_inventory(const RuntimeConfig& cfg) -> std::vector<Device>;

auto make_scheduler_options(const RuntimeConfig& cfg) -> SchedulerOptions;
auto make_health_policy(const RuntimeConfig& cfg) -> HealthPolicy;
auto make_tier_capacities(const RuntimeConfig& cfg) -> TierCapacities;

// =============================================================================
// SchedulerRuntime
// -----------------------------------------------------------------------------
// Owns one instance of every scheduling component for the lifetime of the
// process and drives the background tasks (telemetry, health sweep, queue
// timeouts, rebalance). Members are declared in dependency order so that
// destruction tears the tasks down before the state they touch.
// =============================================================================

class SchedulerRuntime {
 public:
  explicit SchedulerRuntime(
      const RuntimeConfig& cfg, DeviceSampleProvider telemetry = nullptr,
      ClockFn clock = default_clock());
  SchedulerRuntime(
      const RuntimeConfig& cfg, std::vector<Device> devices,
      DeviceSampleProvider telemetry = nullptr,
      ClockFn clock = default_clock());
  ~SchedulerRuntime();

  SchedulerRuntime(const SchedulerRuntime&) = delete;
  auto operator=(const SchedulerRuntime&) -> SchedulerRuntime& = delete;
  SchedulerRuntime(SchedulerRuntime&&) = delete;
  auto operator=(SchedulerRuntime&&) -> SchedulerRuntime& = delete;

  // Loads the configured resident models; returns how many are resident.
  auto preload_models() -> std::size_t;

  void start();
  // Stops every task and logs the reservations lost with the process.
  void stop();

  [[nodiscard]] auto registry() -> DeviceRegistry& { return registry_; }
  [[nodiscard]] auto ledger() -> AllocationLedger& { return ledger_; }
  [[nodiscard]] auto optimizer() -> VramOptimizer& { return optimizer_; }
  [[nodiscard]] auto queue() -> JobQueue& { return queue_; }
  [[nodiscard]] auto scheduler() -> Scheduler& { return scheduler_; }
  [[nodiscard]] auto health() -> HealthMonitor& { return health_; }
  [[nodiscard]] auto balancer() -> VramBalancer& { return balancer_; }
  [[nodiscard]] auto collector() -> MetricsCollector& { return collector_; }

 private:
  RuntimeConfig cfg_;
  DeviceRegistry registry_;
  AllocationLedger ledger_;
  VramOptimizer optimizer_;
  JobQueue queue_;
  TableVramEstimator estimator_;
  Scheduler scheduler_;
  HealthMonitor health_;
  VramBalancer balancer_;
  MetricsCollector collector_;
  PeriodicTask timeout_task_;
  bool stopped_ = false;
};

}  // namespace gpusched
