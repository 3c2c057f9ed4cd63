#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "device_registry.hpp"
#include "scheduling_types.hpp"
#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"

namespace gpusched {

struct Reservation {
  JobId job_id;
  DeviceId device_id = 0;
  Bytes vram_bytes = 0;
  Clock::time_point created_at{};
  PriorityTier priority_tier = PriorityTier::Normal;
  // Breaks created_at ties so that creation order is total.
  std::uint64_t sequence = 0;
};

// =============================================================================
// AllocationLedger
// -----------------------------------------------------------------------------
// Owns every job reservation and the per-device VRAM held by resident models.
// For each device: reserved + resident <= total_vram, always.
//
// Admission capacity is stricter than the invariant:
//   free = total - max(reserved + resident, external_used) - headroom
// so memory the telemetry sees but the ledger does not know about is never
// handed out. All checks and commits happen under one mutex.
// =============================================================================

class AllocationLedger {
 public:
  explicit AllocationLedger(
      const DeviceRegistry& registry, Bytes headroom_bytes = 0,
      VerbosityLevel verbosity = VerbosityLevel::Silent,
      ClockFn clock = default_clock());

  AllocationLedger(const AllocationLedger&) = delete;
  auto operator=(const AllocationLedger&) -> AllocationLedger& = delete;
  AllocationLedger(AllocationLedger&&) = delete;
  auto operator=(AllocationLedger&&) -> AllocationLedger& = delete;
  ~AllocationLedger() = default;

  // Atomic check-then-commit. Throws InsufficientCapacityException,
  // UnknownDeviceException, or LedgerInvariantException when the job already
  // holds a reservation or asks for zero bytes.
  auto try_reserve(
      DeviceId device_id, const JobId& job_id, Bytes vram_bytes,
      PriorityTier priority_tier) -> Reservation;

  // Idempotent: unknown or already released ids return std::nullopt. Throws
  // LedgerInvariantException, keeping the reservation, if the device books
  // fewer reserved bytes than the reservation holds.
  auto release(std::string_view job_id) -> std::optional<Reservation>;

  // Drops every reservation on a device in one step (failover).
  auto release_device(DeviceId device_id) -> std::vector<Reservation>;

  [[nodiscard]] auto free_vram(DeviceId device_id) const -> Bytes;
  // free_vram as it would be after releasing `resident_bytes` of models.
  [[nodiscard]] auto projected_free_vram(
      DeviceId device_id, Bytes resident_bytes) const -> Bytes;
  [[nodiscard]] auto reserved_vram(DeviceId device_id) const -> Bytes;
  [[nodiscard]] auto resident_vram(DeviceId device_id) const -> Bytes;
  [[nodiscard]] auto committed_vram(DeviceId device_id) const -> Bytes;

  [[nodiscard]] auto reservation_for(std::string_view job_id) const
      -> std::optional<Reservation>;
  [[nodiscard]] auto reservations_on(DeviceId device_id) const
      -> std::vector<Reservation>;
  [[nodiscard]] auto reservations() const -> std::vector<Reservation>;
  [[nodiscard]] auto reservation_count() const -> std::size_t;

  // Resident model accounting, driven by the VramOptimizer. commit_resident
  // drops `released_bytes` of evicted models and books `vram_bytes` in one
  // step; on InsufficientCapacityException neither happens.
  void commit_resident(
      DeviceId device_id, Bytes vram_bytes, Bytes released_bytes = 0);
  void release_resident(DeviceId device_id, Bytes vram_bytes);

  [[nodiscard]] auto headroom() const -> Bytes { return headroom_; }

 private:
  struct DeviceLedger {
    Bytes reserved = 0;
    Bytes resident = 0;
  };

  [[nodiscard]] auto free_locked(
      DeviceId device_id, Bytes resident_released = 0) const -> Bytes;
  auto ledger_locked(DeviceId device_id) -> DeviceLedger&;
  [[nodiscard]] auto ledger_locked(DeviceId device_id) const
      -> const DeviceLedger&;
  void check_invariant_locked(
      DeviceId device_id, const DeviceLedger& ledger) const;

  const DeviceRegistry* registry_;
  Bytes headroom_;
  VerbosityLevel verbosity_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  std::unordered_map<JobId, Reservation, TransparentHash, std::equal_to<>>
      reservations_;
  std::map<DeviceId, DeviceLedger> devices_;
  std::uint64_t next_sequence_ = 0;
};

}  // namespace gpusched
