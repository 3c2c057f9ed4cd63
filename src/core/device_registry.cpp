#include "device_registry.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace gpusched {

namespace {
constexpr double kMaxUtilizationPct = 100.0;

auto
unknown_device_message(DeviceId device_id) -> std::string
{
  return "Unknown GPU device id " + std::to_string(device_id);
}
}  // namespace

DeviceRegistry::DeviceRegistry(
    std::vector<Device> devices, VerbosityLevel verbosity)
    : verbosity_(verbosity)
{
  if (devices.empty()) {
    throw ConfigurationException("Device inventory must not be empty");
  }
  for (auto& device : devices) {
    if (device.id < 0) {
      throw ConfigurationException(
          "Device id must be >= 0, got " + std::to_string(device.id));
    }
    if (device.total_vram == 0) {
      throw ConfigurationException(
          "Device " + std::to_string(device.id) + " reports zero VRAM");
    }
    device.external_used_vram =
        std::min(device.external_used_vram, device.total_vram);
    device.nvlink_peers.erase(device.id);
    const auto id = device.id;
    if (!devices_.try_emplace(id, std::move(device)).second) {
      throw ConfigurationException(
          "Duplicate device id " + std::to_string(id));
    }
  }
}

auto
DeviceRegistry::locked_device(DeviceId device_id) -> Device&
{
  auto iter = devices_.find(device_id);
  if (iter == devices_.end()) {
    throw UnknownDeviceException(unknown_device_message(device_id));
  }
  return iter->second;
}

auto
DeviceRegistry::locked_device(DeviceId device_id) const -> const Device&
{
  auto iter = devices_.find(device_id);
  if (iter == devices_.end()) {
    throw UnknownDeviceException(unknown_device_message(device_id));
  }
  return iter->second;
}

auto
DeviceRegistry::list_devices() const -> std::vector<Device>
{
  const std::scoped_lock lock(mutex_);
  std::vector<Device> snapshot;
  snapshot.reserve(devices_.size());
  for (const auto& [id, device] : devices_) {
    snapshot.push_back(device);
  }
  return snapshot;
}

auto
DeviceRegistry::find_device(DeviceId device_id) const -> std::optional<Device>
{
  const std::scoped_lock lock(mutex_);
  auto iter = devices_.find(device_id);
  if (iter == devices_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

auto
DeviceRegistry::contains(DeviceId device_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  return devices_.contains(device_id);
}

auto
DeviceRegistry::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return devices_.size();
}

auto
DeviceRegistry::total_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return locked_device(device_id).total_vram;
}

auto
DeviceRegistry::external_used_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return locked_device(device_id).external_used_vram;
}

auto
DeviceRegistry::is_healthy(DeviceId device_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  return locked_device(device_id).healthy;
}

void
DeviceRegistry::update_metrics(
    DeviceId device_id, double utilization_pct, double temperature_c,
    Bytes used_vram_external)
{
  const std::scoped_lock lock(mutex_);
  auto& device = locked_device(device_id);
  if (used_vram_external > device.total_vram) {
    log_warning(
        "GPU " + std::to_string(device_id) + " reported " +
        std::to_string(used_vram_external) + " bytes in use, above its " +
        std::to_string(device.total_vram) + " bytes total; clamping");
    used_vram_external = device.total_vram;
  }
  device.utilization_pct =
      std::clamp(utilization_pct, 0.0, kMaxUtilizationPct);
  device.temperature_c = temperature_c;
  device.external_used_vram = used_vram_external;
}

auto
DeviceRegistry::ingest_metrics(
    DeviceId device_id, double utilization_pct, double temperature_c,
    Bytes used_vram_external) -> bool
{
  try {
    update_metrics(
        device_id, utilization_pct, temperature_c, used_vram_external);
  }
  catch (const UnknownDeviceException& e) {
    log_warning(std::string("Dropping device metrics: ") + e.what());
    return false;
  }
  log_trace(
      verbosity_, "GPU " + std::to_string(device_id) +
                      " metrics: util=" + std::to_string(utilization_pct) +
                      "% temp=" + std::to_string(temperature_c) + "C used=" +
                      std::to_string(used_vram_external));
  return true;
}

auto
DeviceRegistry::mark_unhealthy(DeviceId device_id, std::string reason) -> bool
{
  {
    const std::scoped_lock lock(mutex_);
    auto& device = locked_device(device_id);
    if (!device.healthy) {
      return false;
    }
    device.healthy = false;
    device.unhealthy_reason = reason;
  }
  log_warning_critical(
      "GPU " + std::to_string(device_id) + " marked unhealthy: " + reason);
  notify_health_change(device_id, false, reason);
  return true;
}

auto
DeviceRegistry::mark_healthy(DeviceId device_id) -> bool
{
  {
    const std::scoped_lock lock(mutex_);
    auto& device = locked_device(device_id);
    if (device.healthy) {
      return false;
    }
    device.healthy = true;
    device.unhealthy_reason.clear();
  }
  log_info(verbosity_, "GPU " + std::to_string(device_id) + " back in service");
  notify_health_change(device_id, true, {});
  return true;
}

auto
DeviceRegistry::add_health_listener(HealthListener listener) -> ListenerToken
{
  const std::scoped_lock lock(listeners_mutex_);
  const auto token = next_token_++;
  listeners_.emplace(token, std::move(listener));
  return token;
}

void
DeviceRegistry::remove_health_listener(ListenerToken token)
{
  const std::scoped_lock lock(listeners_mutex_);
  listeners_.erase(token);
}

void
DeviceRegistry::notify_health_change(
    DeviceId device_id, bool healthy, const std::string& reason)
{
  std::vector<HealthListener> listeners;
  {
    const std::scoped_lock lock(listeners_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [token, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto& listener : listeners) {
    listener(device_id, healthy, reason);
  }
}

}  // namespace gpusched
