#include "allocation_ledger.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace gpusched {

namespace {
auto
device_label(DeviceId device_id) -> std::string
{
  return "GPU " + std::to_string(device_id);
}

auto
created_before(const Reservation& lhs, const Reservation& rhs) -> bool
{
  if (lhs.created_at != rhs.created_at) {
    return lhs.created_at < rhs.created_at;
  }
  return lhs.sequence < rhs.sequence;
}
}  // namespace

AllocationLedger::AllocationLedger(
    const DeviceRegistry& registry, Bytes headroom_bytes,
    VerbosityLevel verbosity, ClockFn clock)
    : registry_(&registry), headroom_(headroom_bytes), verbosity_(verbosity),
      clock_(clock ? std::move(clock) : default_clock())
{
  for (const auto& device : registry.list_devices()) {
    devices_.try_emplace(device.id);
  }
}

auto
AllocationLedger::ledger_locked(DeviceId device_id) -> DeviceLedger&
{
  auto iter = devices_.find(device_id);
  if (iter == devices_.end()) {
    throw UnknownDeviceException(
        "Unknown GPU device id " + std::to_string(device_id));
  }
  return iter->second;
}

auto
AllocationLedger::ledger_locked(DeviceId device_id) const
    -> const DeviceLedger&
{
  auto iter = devices_.find(device_id);
  if (iter == devices_.end()) {
    throw UnknownDeviceException(
        "Unknown GPU device id " + std::to_string(device_id));
  }
  return iter->second;
}

auto
AllocationLedger::free_locked(DeviceId device_id, Bytes resident_released) const
    -> Bytes
{
  const auto& ledger = ledger_locked(device_id);
  const Bytes total = registry_->total_vram(device_id);
  const Bytes external = registry_->external_used_vram(device_id);
  const Bytes resident =
      ledger.resident - std::min(ledger.resident, resident_released);
  const Bytes committed = ledger.reserved + resident;
  const Bytes in_use = std::max(committed, external) + headroom_;
  return in_use >= total ? 0 : total - in_use;
}

void
AllocationLedger::check_invariant_locked(
    DeviceId device_id, const DeviceLedger& ledger) const
{
  const Bytes total = registry_->total_vram(device_id);
  if (ledger.reserved > total || ledger.resident > total - ledger.reserved) {
    const std::string message =
        device_label(device_id) + " ledger over-committed: reserved=" +
        std::to_string(ledger.reserved) + " resident=" +
        std::to_string(ledger.resident) + " total=" + std::to_string(total);
    log_error(message);
    throw LedgerInvariantException(message);
  }
}

auto
AllocationLedger::try_reserve(
    DeviceId device_id, const JobId& job_id, Bytes vram_bytes,
    PriorityTier priority_tier) -> Reservation
{
  if (vram_bytes == 0) {
    const std::string message =
        "Reservation for job " + job_id + " must request VRAM";
    log_error(message);
    throw LedgerInvariantException(message);
  }

  const std::scoped_lock lock(mutex_);
  auto& ledger = ledger_locked(device_id);

  if (auto existing = reservations_.find(job_id);
      existing != reservations_.end()) {
    const std::string message =
        "Job " + job_id + " already holds a reservation on " +
        device_label(existing->second.device_id);
    log_error(message);
    throw LedgerInvariantException(message);
  }

  const Bytes available = free_locked(device_id);
  if (vram_bytes > available) {
    throw InsufficientCapacityException(
        device_label(device_id) + " has " + std::to_string(available) +
        " bytes free, job " + job_id + " needs " + std::to_string(vram_bytes));
  }

  DeviceLedger next = ledger;
  next.reserved += vram_bytes;
  check_invariant_locked(device_id, next);
  ledger = next;

  Reservation reservation{
      job_id, device_id, vram_bytes, clock_(), priority_tier,
      ++next_sequence_};
  reservations_.emplace(job_id, reservation);
  log_trace(
      verbosity_, "Reserved " + std::to_string(vram_bytes) + " bytes on " +
                      device_label(device_id) + " for job " + job_id);
  return reservation;
}

auto
AllocationLedger::release(std::string_view job_id) -> std::optional<Reservation>
{
  const std::scoped_lock lock(mutex_);
  auto iter = reservations_.find(job_id);
  if (iter == reservations_.end()) {
    return std::nullopt;
  }

  auto& ledger = ledger_locked(iter->second.device_id);
  if (ledger.reserved < iter->second.vram_bytes) {
    const std::string message =
        device_label(iter->second.device_id) + " books " +
        std::to_string(ledger.reserved) + " reserved bytes, job " +
        iter->second.job_id + " holds " +
        std::to_string(iter->second.vram_bytes);
    log_error(message);
    throw LedgerInvariantException(message);
  }
  ledger.reserved -= iter->second.vram_bytes;
  Reservation reservation = std::move(iter->second);
  reservations_.erase(iter);
  log_trace(
      verbosity_, "Released " + std::to_string(reservation.vram_bytes) +
                      " bytes on " + device_label(reservation.device_id) +
                      " from job " + reservation.job_id);
  return reservation;
}

auto
AllocationLedger::release_device(DeviceId device_id)
    -> std::vector<Reservation>
{
  const std::scoped_lock lock(mutex_);
  auto& ledger = ledger_locked(device_id);
  std::vector<Reservation> released;
  for (auto iter = reservations_.begin(); iter != reservations_.end();) {
    if (iter->second.device_id == device_id) {
      released.push_back(std::move(iter->second));
      iter = reservations_.erase(iter);
    } else {
      ++iter;
    }
  }
  ledger.reserved = 0;
  std::ranges::sort(released, created_before);
  return released;
}

auto
AllocationLedger::free_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return free_locked(device_id);
}

auto
AllocationLedger::projected_free_vram(
    DeviceId device_id, Bytes resident_bytes) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return free_locked(device_id, resident_bytes);
}

auto
AllocationLedger::reserved_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return ledger_locked(device_id).reserved;
}

auto
AllocationLedger::resident_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  return ledger_locked(device_id).resident;
}

auto
AllocationLedger::committed_vram(DeviceId device_id) const -> Bytes
{
  const std::scoped_lock lock(mutex_);
  const auto& ledger = ledger_locked(device_id);
  return ledger.reserved + ledger.resident;
}

auto
AllocationLedger::reservation_for(std::string_view job_id) const
    -> std::optional<Reservation>
{
  const std::scoped_lock lock(mutex_);
  auto iter = reservations_.find(job_id);
  if (iter == reservations_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

auto
AllocationLedger::reservations_on(DeviceId device_id) const
    -> std::vector<Reservation>
{
  const std::scoped_lock lock(mutex_);
  std::vector<Reservation> result;
  for (const auto& [id, reservation] : reservations_) {
    if (reservation.device_id == device_id) {
      result.push_back(reservation);
    }
  }
  std::ranges::sort(result, created_before);
  return result;
}

auto
AllocationLedger::reservations() const -> std::vector<Reservation>
{
  const std::scoped_lock lock(mutex_);
  std::vector<Reservation> result;
  result.reserve(reservations_.size());
  for (const auto& [id, reservation] : reservations_) {
    result.push_back(reservation);
  }
  return result;
}

auto
AllocationLedger::reservation_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return reservations_.size();
}

void
AllocationLedger::commit_resident(
    DeviceId device_id, Bytes vram_bytes, Bytes released_bytes)
{
  const std::scoped_lock lock(mutex_);
  auto& ledger = ledger_locked(device_id);
  if (released_bytes > ledger.resident) {
    const std::string message =
        device_label(device_id) + " cannot release " +
        std::to_string(released_bytes) + " resident bytes, only " +
        std::to_string(ledger.resident) + " committed";
    log_error(message);
    throw LedgerInvariantException(message);
  }
  const Bytes available = free_locked(device_id, released_bytes);
  if (vram_bytes > available) {
    throw InsufficientCapacityException(
        device_label(device_id) + " has " + std::to_string(available) +
        " bytes free, model needs " + std::to_string(vram_bytes));
  }
  DeviceLedger next = ledger;
  next.resident = next.resident - released_bytes + vram_bytes;
  check_invariant_locked(device_id, next);
  ledger = next;
}

void
AllocationLedger::release_resident(DeviceId device_id, Bytes vram_bytes)
{
  const std::scoped_lock lock(mutex_);
  auto& ledger = ledger_locked(device_id);
  if (vram_bytes > ledger.resident) {
    const std::string message =
        device_label(device_id) + " cannot release " +
        std::to_string(vram_bytes) + " resident bytes, only " +
        std::to_string(ledger.resident) + " committed";
    log_error(message);
    throw LedgerInvariantException(message);
  }
  ledger.resident -= vram_bytes;
}

}  // namespace gpusched
