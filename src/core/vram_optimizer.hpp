#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "allocation_ledger.hpp"
#include "scheduling_types.hpp"
#include "utils/logger.hpp"

namespace gpusched {

// A model kept resident on a device independently of job reservations.
struct LoadedModel {
  std::string name;
  DeviceId device_id = 0;
  Bytes vram_bytes = 0;
  bool loaded = false;
  // Platform floor (e.g. the orchestration UI); never evicted.
  bool baseline = false;
  std::size_t pin_count = 0;
  Clock::time_point last_used_at{};

  [[nodiscard]] auto evictable() const -> bool
  {
    return loaded && !baseline && pin_count == 0;
  }
};

// =============================================================================
// VramOptimizer
// -----------------------------------------------------------------------------
// Frees capacity by unloading idle resident models, least recently used
// first. Job reservations are never touched. Eviction is all-or-nothing: if
// every eligible model together cannot free enough, nothing is unloaded.
// =============================================================================

class VramOptimizer {
 public:
  explicit VramOptimizer(
      AllocationLedger& ledger,
      VerbosityLevel verbosity = VerbosityLevel::Silent,
      ClockFn clock = default_clock());

  VramOptimizer(const VramOptimizer&) = delete;
  auto operator=(const VramOptimizer&) -> VramOptimizer& = delete;
  VramOptimizer(VramOptimizer&&) = delete;
  auto operator=(VramOptimizer&&) -> VramOptimizer& = delete;
  ~VramOptimizer() = default;

  // Makes `name` resident on `device_id`, evicting idle models first when
  // required. Throws InsufficientCapacityException when it still does not fit.
  auto load_model(
      DeviceId device_id, const std::string& name, Bytes vram_bytes,
      bool baseline = false) -> LoadedModel;

  // Returns false when the model is not loaded or is in use.
  auto unload_model(DeviceId device_id, std::string_view name) -> bool;

  // True when free_vram(device_id) >= needed_bytes on return.
  auto try_free_capacity(DeviceId device_id, Bytes needed_bytes) -> bool;

  // Names of the models try_free_capacity would unload, or std::nullopt.
  [[nodiscard]] auto plan_eviction(DeviceId device_id, Bytes needed_bytes) const
      -> std::optional<std::vector<std::string>>;

  // Evicts idle models until at least `bytes` of resident VRAM have been
  // released or no candidate is left. Returns the bytes released.
  auto evict_idle(DeviceId device_id, Bytes bytes) -> Bytes;

  // Marks a resident model as used by a running job.
  auto pin(DeviceId device_id, std::string_view name) -> bool;
  void unpin(DeviceId device_id, std::string_view name);

  [[nodiscard]] auto is_loaded(DeviceId device_id, std::string_view name) const
      -> bool;
  [[nodiscard]] auto models() const -> std::vector<LoadedModel>;
  [[nodiscard]] auto models_on(DeviceId device_id) const
      -> std::vector<LoadedModel>;
  [[nodiscard]] auto evictable_vram(DeviceId device_id) const -> Bytes;

 private:
  using ModelKey = std::pair<DeviceId, std::string>;

  [[nodiscard]] auto lru_candidates_locked(DeviceId device_id) const
      -> std::vector<const LoadedModel*>;
  [[nodiscard]] auto plan_locked(DeviceId device_id, Bytes needed_bytes) const
      -> std::optional<std::vector<std::string>>;
  void unload_locked(LoadedModel& model);
  void mark_unloaded_locked(LoadedModel& model);
  auto find_locked(DeviceId device_id, std::string_view name) -> LoadedModel*;
  [[nodiscard]] auto find_locked(
      DeviceId device_id, std::string_view name) const -> const LoadedModel*;

  AllocationLedger* ledger_;
  VerbosityLevel verbosity_;
  ClockFn clock_;
  mutable std::mutex mutex_;
  std::map<ModelKey, LoadedModel> models_;
};

}  // namespace gpusched
