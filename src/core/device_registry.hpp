#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "scheduling_types.hpp"
#include "utils/logger.hpp"

namespace gpusched {
// =============================================================================
// Device: identity plus the live metrics reported by the telemetry collector
// =============================================================================

struct Device {
  DeviceId id = 0;
  std::string name;
  Bytes total_vram = 0;
  // Memory in use as seen by device telemetry, including memory the ledger
  // does not know about (other processes).
  Bytes external_used_vram = 0;
  double utilization_pct = 0.0;
  double temperature_c = 0.0;
  bool healthy = true;
  std::string unhealthy_reason;
  std::set<DeviceId> nvlink_peers;
};

// =============================================================================
// DeviceRegistry
// -----------------------------------------------------------------------------
// Single source of truth for device inventory and live metrics. Health
// transitions are reported synchronously to every registered listener, after
// the registry lock has been released.
// =============================================================================

class DeviceRegistry {
 public:
  using HealthListener = std::function<void(
      DeviceId device_id, bool healthy, const std::string& reason)>;
  using ListenerToken = std::size_t;

  explicit DeviceRegistry(
      std::vector<Device> devices,
      VerbosityLevel verbosity = VerbosityLevel::Silent);

  DeviceRegistry(const DeviceRegistry&) = delete;
  auto operator=(const DeviceRegistry&) -> DeviceRegistry& = delete;
  DeviceRegistry(DeviceRegistry&&) = delete;
  auto operator=(DeviceRegistry&&) -> DeviceRegistry& = delete;
  ~DeviceRegistry() = default;

  [[nodiscard]] auto list_devices() const -> std::vector<Device>;
  [[nodiscard]] auto find_device(DeviceId device_id) const
      -> std::optional<Device>;
  [[nodiscard]] auto contains(DeviceId device_id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;

  // Throws UnknownDeviceException for ids outside the inventory.
  [[nodiscard]] auto total_vram(DeviceId device_id) const -> Bytes;
  [[nodiscard]] auto external_used_vram(DeviceId device_id) const -> Bytes;
  [[nodiscard]] auto is_healthy(DeviceId device_id) const -> bool;

  // Overwrites the live fields. Throws UnknownDeviceException.
  void update_metrics(
      DeviceId device_id, double utilization_pct, double temperature_c,
      Bytes used_vram_external);

  // Collector entry point: unknown ids are logged and ignored.
  auto ingest_metrics(
      DeviceId device_id, double utilization_pct, double temperature_c,
      Bytes used_vram_external) -> bool;

  // Both return true only when the health flag actually changed.
  auto mark_unhealthy(DeviceId device_id, std::string reason) -> bool;
  auto mark_healthy(DeviceId device_id) -> bool;

  auto add_health_listener(HealthListener listener) -> ListenerToken;
  void remove_health_listener(ListenerToken token);

 private:
  void notify_health_change(
      DeviceId device_id, bool healthy, const std::string& reason);
  auto locked_device(DeviceId device_id) -> Device&;
  [[nodiscard]] auto locked_device(DeviceId device_id) const -> const Device&;

  mutable std::mutex mutex_;
  std::map<DeviceId, Device> devices_;
  std::mutex listeners_mutex_;
  std::map<ListenerToken, HealthListener> listeners_;
  ListenerToken next_token_ = 1;
  VerbosityLevel verbosity_;
};

}  // namespace gpusched
