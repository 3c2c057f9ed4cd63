#include "vram_optimizer.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace gpusched {

VramOptimizer::VramOptimizer(
    AllocationLedger& ledger, VerbosityLevel verbosity, ClockFn clock)
    : ledger_(&ledger), verbosity_(verbosity),
      clock_(clock ? std::move(clock) : default_clock())
{
}

auto
VramOptimizer::find_locked(DeviceId device_id, std::string_view name)
    -> LoadedModel*
{
  auto iter = models_.find(ModelKey{device_id, std::string(name)});
  return iter == models_.end() ? nullptr : &iter->second;
}

auto
VramOptimizer::find_locked(DeviceId device_id, std::string_view name) const
    -> const LoadedModel*
{
  auto iter = models_.find(ModelKey{device_id, std::string(name)});
  return iter == models_.end() ? nullptr : &iter->second;
}

auto
VramOptimizer::lru_candidates_locked(DeviceId device_id) const
    -> std::vector<const LoadedModel*>
{
  std::vector<const LoadedModel*> candidates;
  for (const auto& [key, model] : models_) {
    if (key.first == device_id && model.evictable()) {
      candidates.push_back(&model);
    }
  }
  std::ranges::sort(candidates, [](const auto* lhs, const auto* rhs) {
    if (lhs->last_used_at != rhs->last_used_at) {
      return lhs->last_used_at < rhs->last_used_at;
    }
    return lhs->name < rhs->name;
  });
  return candidates;
}

auto
VramOptimizer::plan_locked(DeviceId device_id, Bytes needed_bytes) const
    -> std::optional<std::vector<std::string>>
{
  if (ledger_->free_vram(device_id) >= needed_bytes) {
    return std::vector<std::string>{};
  }
  std::vector<std::string> victims;
  Bytes released = 0;
  for (const auto* model : lru_candidates_locked(device_id)) {
    released += model->vram_bytes;
    victims.push_back(model->name);
    if (ledger_->projected_free_vram(device_id, released) >= needed_bytes) {
      return victims;
    }
  }
  return std::nullopt;
}

void
VramOptimizer::unload_locked(LoadedModel& model)
{
  ledger_->release_resident(model.device_id, model.vram_bytes);
  mark_unloaded_locked(model);
}

void
VramOptimizer::mark_unloaded_locked(LoadedModel& model)
{
  model.loaded = false;
  log_info(
      verbosity_, "Evicted model " + model.name + " (" +
                      std::to_string(model.vram_bytes) + " bytes) from GPU " +
                      std::to_string(model.device_id));
}

auto
VramOptimizer::load_model(
    DeviceId device_id, const std::string& name, Bytes vram_bytes,
    bool baseline) -> LoadedModel
{
  if (name.empty() || vram_bytes == 0) {
    throw InvalidJobException("Resident model needs a name and a VRAM size");
  }
  const std::scoped_lock lock(mutex_);
  if (auto* existing = find_locked(device_id, name);
      existing != nullptr && existing->loaded) {
    existing->last_used_at = clock_();
    return *existing;
  }

  std::vector<LoadedModel*> victims;
  Bytes victim_bytes = 0;
  if (ledger_->free_vram(device_id) < vram_bytes) {
    auto plan = plan_locked(device_id, vram_bytes);
    if (!plan) {
      throw InsufficientCapacityException(
          "Cannot load model " + name + " on GPU " +
          std::to_string(device_id) + ": not enough VRAM even after eviction");
    }
    for (const auto& victim : *plan) {
      auto* model = find_locked(device_id, victim);
      victim_bytes += model->vram_bytes;
      victims.push_back(model);
    }
  }
  // Evictions and the new model land in the ledger together; if a
  // reservation took the room meanwhile, the victims stay resident.
  ledger_->commit_resident(device_id, vram_bytes, victim_bytes);
  for (auto* victim : victims) {
    mark_unloaded_locked(*victim);
  }
  if (!victims.empty()) {
    increment_evictions(victims.size());
  }

  auto& model = models_[ModelKey{device_id, name}];
  model.name = name;
  model.device_id = device_id;
  model.vram_bytes = vram_bytes;
  model.loaded = true;
  model.baseline = baseline;
  model.last_used_at = clock_();
  log_info(
      verbosity_, "Loaded model " + name + " (" + std::to_string(vram_bytes) +
                      " bytes" + (baseline ? ", baseline" : "") + ") on GPU " +
                      std::to_string(device_id));
  return model;
}

auto
VramOptimizer::unload_model(DeviceId device_id, std::string_view name) -> bool
{
  const std::scoped_lock lock(mutex_);
  auto* model = find_locked(device_id, name);
  if (model == nullptr || !model->loaded) {
    return false;
  }
  if (model->pin_count > 0) {
    log_warning(
        "Model " + model->name + " on GPU " + std::to_string(device_id) +
        " is in use and cannot be unloaded");
    return false;
  }
  unload_locked(*model);
  return true;
}

auto
VramOptimizer::try_free_capacity(DeviceId device_id, Bytes needed_bytes) -> bool
{
  const std::scoped_lock lock(mutex_);
  auto victims = plan_locked(device_id, needed_bytes);
  if (!victims) {
    const EvictionFailedException failure(
        "Evicting idle models on GPU " + std::to_string(device_id) +
        " cannot free " + std::to_string(needed_bytes) + " bytes");
    log_debug(verbosity_, failure.what());
    return false;
  }
  for (const auto& victim : *victims) {
    unload_locked(*find_locked(device_id, victim));
  }
  if (!victims->empty()) {
    increment_evictions(victims->size());
  }
  return true;
}

auto
VramOptimizer::plan_eviction(DeviceId device_id, Bytes needed_bytes) const
    -> std::optional<std::vector<std::string>>
{
  const std::scoped_lock lock(mutex_);
  return plan_locked(device_id, needed_bytes);
}

auto
VramOptimizer::evict_idle(DeviceId device_id, Bytes bytes) -> Bytes
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::string> victims;
  Bytes released = 0;
  for (const auto* model : lru_candidates_locked(device_id)) {
    if (released >= bytes) {
      break;
    }
    released += model->vram_bytes;
    victims.push_back(model->name);
  }
  for (const auto& victim : victims) {
    unload_locked(*find_locked(device_id, victim));
  }
  if (!victims.empty()) {
    increment_evictions(victims.size());
  }
  return released;
}

auto
VramOptimizer::pin(DeviceId device_id, std::string_view name) -> bool
{
  const std::scoped_lock lock(mutex_);
  auto* model = find_locked(device_id, name);
  if (model == nullptr || !model->loaded) {
    return false;
  }
  ++model->pin_count;
  model->last_used_at = clock_();
  return true;
}

void
VramOptimizer::unpin(DeviceId device_id, std::string_view name)
{
  const std::scoped_lock lock(mutex_);
  auto* model = find_locked(device_id, name);
  if (model == nullptr || model->pin_count == 0) {
    return;
  }
  --model->pin_count;
  model->last_used_at = clock_();
}

auto
VramOptimizer::is_loaded(DeviceId device_id, std::string_view name) const
    -> bool
{
  const std::scoped_lock lock(mutex_);
  const auto* model = find_locked(device_id, name);
  return model != nullptr && model->loaded;
}

auto
VramOptimizer::models() const -> std::vector<LoadedModel>
{
  const std::scoped_lock lock(mutex_);
  std::vector<LoadedModel> result;
  result.reserve(models_.size());
  for (const auto& [key, model] : models_) {
    result.push_back(model);
  }
  return result;
}

auto
VramOptimizer::models_on(DeviceId device_id) const -> std::vector<LoadedModel>
{
  const std::scoped_lock lock(mutex_);
  std::vector<LoadedModel> result;
  for (const auto& [key, model] : models_) {
    if (key.first == device_id) {
      result.push_back(model);
    }
  }
  return result;
}

auto
VramOptimizer::evictable_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  Bytes total = 0;
  for (const auto* model : lru_candidates_locked(device_id)) {
    total += model->vram_bytes;
  }
  return total;
}

}  // namespace gpusched
