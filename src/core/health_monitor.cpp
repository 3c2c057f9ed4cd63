#include "health_monitor.hpp"

#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace gpusched {

namespace {
constexpr double kPercent = 100.0;
}  // namespace

HealthMonitor::HealthMonitor(
    DeviceRegistry& registry, HealthPolicy policy, VerbosityLevel verbosity,
    ClockFn clock)
    : registry_(&registry), policy_(policy), verbosity_(verbosity),
      clock_(clock ? std::move(clock) : default_clock())
{
}

HealthMonitor::~HealthMonitor()
{
  stop();
}

void
HealthMonitor::prune_errors_locked(
    DeviceHealth& health, Clock::time_point now) const
{
  while (!health.errors.empty() &&
         now - health.errors.front() > policy_.error_window) {
    health.errors.pop_front();
  }
}

void
HealthMonitor::record_error(DeviceId device_id)
{
  if (!registry_->contains(device_id)) {
    throw UnknownDeviceException(
        "Unknown GPU device id " + std::to_string(device_id));
  }
  const auto now = clock_();
  std::size_t count = 0;
  {
    const std::scoped_lock lock(mutex_);
    auto& health = health_[device_id];
    health.errors.push_back(now);
    prune_errors_locked(health, now);
    count = health.errors.size();
  }
  increment_device_errors(device_id);
  log_debug(
      verbosity_, "GPU " + std::to_string(device_id) + " error recorded (" +
                      std::to_string(count) + " in window)");
}

auto
HealthMonitor::error_count(DeviceId device_id) const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  auto iter = health_.find(device_id);
  if (iter == health_.end()) {
    return 0;
  }
  std::size_t count = 0;
  const auto cutoff = clock_() - policy_.error_window;
  for (const auto& stamp : iter->second.errors) {
    if (stamp >= cutoff) {
      ++count;
    }
  }
  return count;
}

auto
HealthMonitor::breach_reason(const Device& device, std::size_t errors) const
    -> std::string
{
  if (device.temperature_c > policy_.temperature_limit_c) {
    return "temperature " + std::to_string(device.temperature_c) +
           "C above limit " + std::to_string(policy_.temperature_limit_c) +
           "C";
  }
  if (errors > policy_.error_threshold) {
    return std::to_string(errors) + " errors within " +
           std::to_string(policy_.error_window.count()) + " s";
  }
  return {};
}

auto
HealthMonitor::alert(const Device& device) const -> std::size_t
{
  std::size_t alerts = 0;
  const std::string label = "GPU " + std::to_string(device.id);
  if (device.utilization_pct > policy_.utilization_warning_pct) {
    log_warning(
        label + " utilization at " + std::to_string(device.utilization_pct) +
        "%");
    ++alerts;
  }
  const double memory_pct =
      static_cast<double>(device.external_used_vram) /
      static_cast<double>(device.total_vram) * kPercent;
  if (memory_pct > policy_.memory_warning_pct) {
    log_warning(label + " memory usage at " + std::to_string(memory_pct) + "%");
    ++alerts;
  }
  return alerts;
}

auto
HealthMonitor::sweep() -> HealthSweepResult
{
  struct Transition {
    DeviceId device_id;
    bool healthy;
    std::string reason;
  };

  HealthSweepResult result;
  std::vector<Transition> transitions;
  const auto now = clock_();
  const auto devices = registry_->list_devices();
  {
    const std::scoped_lock lock(mutex_);
    for (const auto& device : devices) {
      auto& health = health_[device.id];
      prune_errors_locked(health, now);
      const auto reason = breach_reason(device, health.errors.size());

      if (device.healthy) {
        health.quarantined_by_monitor = false;
        if (!reason.empty()) {
          transitions.push_back({device.id, false, reason});
          continue;
        }
        result.alerts += alert(device);
        continue;
      }

      if (!health.quarantined_by_monitor) {
        continue;
      }
      if (!reason.empty()) {
        health.clean_sweeps = 0;
        continue;
      }
      if (++health.clean_sweeps >= policy_.recovery_sweeps) {
        transitions.push_back({device.id, true, {}});
      }
    }
  }

  // Registry notifications run the scheduler failover; keep them unlocked.
  for (const auto& transition : transitions) {
    if (transition.healthy) {
      if (registry_->mark_healthy(transition.device_id)) {
        result.recovered.push_back(transition.device_id);
      }
      const std::scoped_lock lock(mutex_);
      auto& health = health_[transition.device_id];
      health.quarantined_by_monitor = false;
      health.clean_sweeps = 0;
      continue;
    }
    if (registry_->mark_unhealthy(transition.device_id, transition.reason)) {
      result.quarantined.push_back(transition.device_id);
      const std::scoped_lock lock(mutex_);
      auto& health = health_[transition.device_id];
      health.quarantined_by_monitor = true;
      health.clean_sweeps = 0;
    }
  }
  return result;
}

void
HealthMonitor::start()
{
  if (!task_) {
    task_ = std::make_unique<PeriodicTask>(
        "health monitor", policy_.interval, [this] { sweep(); }, verbosity_);
  }
  task_->start();
}

void
HealthMonitor::stop()
{
  if (task_) {
    task_->stop();
  }
}

auto
HealthMonitor::running() const -> bool
{
  return task_ && task_->running();
}

}  // namespace gpusched
