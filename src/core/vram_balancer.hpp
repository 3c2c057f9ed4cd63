#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "allocation_ledger.hpp"
#include "device_registry.hpp"
#include "periodic_task.hpp"
#include "scheduling_types.hpp"
#include "utils/logger.hpp"
#include "vram_optimizer.hpp"

namespace gpusched {

struct RebalancePolicy {
  std::chrono::seconds interval{30};
  // A device is overloaded when committed > average * (1 + deviation_ratio).
  double deviation_ratio = 0.2;
  bool evict_idle_models = false;
};

struct DeviceImbalance {
  DeviceId device_id = 0;
  Bytes committed = 0;
  Bytes threshold = 0;
  Bytes evicted = 0;
};

// Secondary background pass; admission itself always picks the device with
// the most free VRAM.
class VramBalancer {
 public:
  VramBalancer(
      const DeviceRegistry& registry, const AllocationLedger& ledger,
      VramOptimizer& optimizer, RebalancePolicy policy = {},
      VerbosityLevel verbosity = VerbosityLevel::Silent);

  VramBalancer(const VramBalancer&) = delete;
  auto operator=(const VramBalancer&) -> VramBalancer& = delete;
  VramBalancer(VramBalancer&&) = delete;
  auto operator=(VramBalancer&&) -> VramBalancer& = delete;
  ~VramBalancer();

  auto rebalance() -> std::vector<DeviceImbalance>;

  void start();
  void stop();

 private:
  const DeviceRegistry* registry_;
  const AllocationLedger* ledger_;
  VramOptimizer* optimizer_;
  RebalancePolicy policy_;
  VerbosityLevel verbosity_;
  std::unique_ptr<PeriodicTask> task_;
};

}  // namespace gpusched
