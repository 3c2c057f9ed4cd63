#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "core/device_registry.hpp"
#include "core/periodic_task.hpp"
#include "core/scheduling_types.hpp"
#include "utils/logger.hpp"

namespace gpusched {

struct DeviceSample {
  DeviceId device_id{0};
  double utilization_pct{0.0};
  double temperature_c{0.0};
  Bytes used_vram{0};
};

using DeviceSampleProvider = std::function<std::vector<DeviceSample>()>;

inline constexpr std::chrono::milliseconds kDefaultTelemetryInterval{15000};

// =============================================================================
// MetricsCollector
// -----------------------------------------------------------------------------
// Pulls device telemetry on a fixed interval and pushes it into the
// registry. Samples for devices outside the inventory are dropped.
// =============================================================================

class MetricsCollector {
 public:
  MetricsCollector(
      DeviceRegistry& registry, DeviceSampleProvider provider = nullptr,
      std::chrono::milliseconds interval = kDefaultTelemetryInterval,
      VerbosityLevel verbosity = VerbosityLevel::Silent);

  MetricsCollector(const MetricsCollector&) = delete;
  auto operator=(const MetricsCollector&) -> MetricsCollector& = delete;
  MetricsCollector(MetricsCollector&&) = delete;
  auto operator=(MetricsCollector&&) -> MetricsCollector& = delete;
  ~MetricsCollector();

  // Returns the number of samples the registry accepted.
  auto collect_once() -> std::size_t;

  void start();
  void stop();

 private:
  DeviceRegistry* registry_;
  DeviceSampleProvider provider_;
  std::chrono::milliseconds interval_;
  VerbosityLevel verbosity_;
  std::unique_ptr<PeriodicTask> task_;
};

// NVML-backed telemetry. Without NVML support both return nothing.
auto query_nvml_samples() -> std::vector<DeviceSample>;
auto discover_nvml_devices() -> std::vector<Device>;

}  // namespace gpusched
