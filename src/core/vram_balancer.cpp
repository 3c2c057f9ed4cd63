#include "vram_balancer.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gpusched {

VramBalancer::VramBalancer(
    const DeviceRegistry& registry, const AllocationLedger& ledger,
    VramOptimizer& optimizer, RebalancePolicy policy, VerbosityLevel verbosity)
    : registry_(&registry), ledger_(&ledger), optimizer_(&optimizer),
      policy_(policy), verbosity_(verbosity)
{
}

VramBalancer::~VramBalancer()
{
  stop();
}

auto
VramBalancer::rebalance() -> std::vector<DeviceImbalance>
{
  std::vector<std::pair<DeviceId, Bytes>> committed;
  Bytes sum = 0;
  for (const auto& device : registry_->list_devices()) {
    if (!device.healthy) {
      continue;
    }
    const Bytes used = ledger_->committed_vram(device.id);
    committed.emplace_back(device.id, used);
    sum += used;
  }
  std::vector<DeviceImbalance> imbalances;
  if (committed.size() < 2 || sum == 0) {
    return imbalances;
  }

  const double average =
      static_cast<double>(sum) / static_cast<double>(committed.size());
  const auto threshold =
      static_cast<Bytes>(average * (1.0 + policy_.deviation_ratio));

  for (const auto& [device_id, used] : committed) {
    if (used <= threshold) {
      continue;
    }
    DeviceImbalance imbalance{device_id, used, threshold, 0};
    if (policy_.evict_idle_models) {
      imbalance.evicted = optimizer_->evict_idle(device_id, used - threshold);
    }
    log_info(
        verbosity_, "GPU " + std::to_string(device_id) + " holds " +
                        std::to_string(used) + " bytes, above balance " +
                        "threshold " + std::to_string(threshold) +
                        "; evicted " + std::to_string(imbalance.evicted));
    imbalances.push_back(imbalance);
  }
  return imbalances;
}

void
VramBalancer::start()
{
  if (!task_) {
    task_ = std::make_unique<PeriodicTask>(
        "vram balancer",
        std::chrono::duration_cast<std::chrono::milliseconds>(
            policy_.interval),
        [this] { rebalance(); }, verbosity_);
  }
  task_->start();
}

void
VramBalancer::stop()
{
  if (task_) {
    task_->stop();
  }
}

}  // namespace gpusched
