#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "device_registry.hpp"
#include "periodic_task.hpp"
#include "scheduling_types.hpp"
#include "utils/logger.hpp"

namespace gpusched {

inline constexpr std::chrono::milliseconds kDefaultHealthInterval{15000};
inline constexpr double kDefaultTemperatureLimitC = 85.0;
inline constexpr std::size_t kDefaultErrorThreshold = 10;
inline constexpr std::chrono::seconds kDefaultErrorWindow{60};
inline constexpr std::size_t kDefaultRecoverySweeps = 3;
inline constexpr double kDefaultWarningPct = 95.0;

struct HealthPolicy {
  std::chrono::milliseconds interval = kDefaultHealthInterval;
  double temperature_limit_c = kDefaultTemperatureLimitC;
  // A device is quarantined once its windowed error count exceeds this.
  std::size_t error_threshold = kDefaultErrorThreshold;
  std::chrono::seconds error_window = kDefaultErrorWindow;
  // Consecutive clean sweeps required before a device is put back.
  std::size_t recovery_sweeps = kDefaultRecoverySweeps;
  double utilization_warning_pct = kDefaultWarningPct;
  double memory_warning_pct = kDefaultWarningPct;
};

struct HealthSweepResult {
  std::vector<DeviceId> quarantined;
  std::vector<DeviceId> recovered;
  std::size_t alerts = 0;
};

// =============================================================================
// HealthMonitor
// -----------------------------------------------------------------------------
// Periodic sweep over the registry. Breaching devices are marked unhealthy,
// which makes the scheduler fail their work over. Only devices this monitor
// quarantined are recovered automatically, and only after `recovery_sweeps`
// clean sweeps in a row.
// =============================================================================

class HealthMonitor {
 public:
  explicit HealthMonitor(
      DeviceRegistry& registry, HealthPolicy policy = {},
      VerbosityLevel verbosity = VerbosityLevel::Silent,
      ClockFn clock = default_clock());

  HealthMonitor(const HealthMonitor&) = delete;
  auto operator=(const HealthMonitor&) -> HealthMonitor& = delete;
  HealthMonitor(HealthMonitor&&) = delete;
  auto operator=(HealthMonitor&&) -> HealthMonitor& = delete;
  ~HealthMonitor();

  // Executor-reported device fault.
  void record_error(DeviceId device_id);
  [[nodiscard]] auto error_count(DeviceId device_id) const -> std::size_t;

  auto sweep() -> HealthSweepResult;

  void start();
  void stop();
  [[nodiscard]] auto running() const -> bool;

 private:
  struct DeviceHealth {
    std::deque<Clock::time_point> errors;
    std::size_t clean_sweeps = 0;
    bool quarantined_by_monitor = false;
  };

  void prune_errors_locked(DeviceHealth& health, Clock::time_point now) const;
  [[nodiscard]] auto breach_reason(
      const Device& device, std::size_t errors) const -> std::string;
  auto alert(const Device& device) const -> std::size_t;

  DeviceRegistry* registry_;
  HealthPolicy policy_;
  VerbosityLevel verbosity_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  std::map<DeviceId, DeviceHealth> health_;
  std::unique_ptr<PeriodicTask> task_;
};

}  // namespace gpusched
