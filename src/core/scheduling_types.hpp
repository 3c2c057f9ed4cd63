#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gpusched {

using DeviceId = int;
using JobId = std::string;
using Bytes = std::uint64_t;

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;

inline constexpr Bytes kBytesPerKiB = 1024ULL;
inline constexpr Bytes kBytesPerMiB = kBytesPerKiB * 1024ULL;

[[nodiscard]] inline auto
default_clock() -> ClockFn
{
  return [] { return Clock::now(); };
}

// =============================================================================
// PriorityTier: queuing classes, scanned in declaration order
// =============================================================================

enum class PriorityTier : std::uint8_t {
  Realtime = 0,
  High = 1,
  Normal = 2,
  Batch = 3
};

inline constexpr std::size_t kTierCount = 4;
inline constexpr std::array<PriorityTier, kTierCount> kTierOrder{
    PriorityTier::Realtime, PriorityTier::High, PriorityTier::Normal,
    PriorityTier::Batch};

[[nodiscard]] constexpr auto
tier_index(PriorityTier tier) -> std::size_t
{
  return static_cast<std::size_t>(std::to_underlying(tier));
}

[[nodiscard]] constexpr auto
to_string(PriorityTier tier) -> std::string_view
{
  switch (tier) {
    case PriorityTier::Realtime:
      return "realtime";
    case PriorityTier::High:
      return "high";
    case PriorityTier::Normal:
      return "normal";
    case PriorityTier::Batch:
      return "batch";
  }
  return "unknown";
}

inline auto
parse_priority_tier(std::string_view name) -> PriorityTier
{
  for (const auto tier : kTierOrder) {
    if (to_string(tier) == name) {
      return tier;
    }
  }
  throw std::invalid_argument(
      "Unknown priority tier: " + std::string(name));
}

// =============================================================================
// JobKind / JobState
// =============================================================================

enum class JobKind : std::uint8_t { Image = 0, Video = 1, Speech = 2 };

[[nodiscard]] constexpr auto
to_string(JobKind kind) -> std::string_view
{
  switch (kind) {
    case JobKind::Image:
      return "image";
    case JobKind::Video:
      return "video";
    case JobKind::Speech:
      return "speech";
  }
  return "unknown";
}

// queued -> admitted -> running -> {completed, failed}
// queued -> cancelled, running -> cancelled
// Failover moves admitted/running back to queued.
enum class JobState : std::uint8_t {
  Queued = 0,
  Admitted,
  Running,
  Completed,
  Failed,
  Cancelled
};

[[nodiscard]] constexpr auto
to_string(JobState state) -> std::string_view
{
  switch (state) {
    case JobState::Queued:
      return "queued";
    case JobState::Admitted:
      return "admitted";
    case JobState::Running:
      return "running";
    case JobState::Completed:
      return "completed";
    case JobState::Failed:
      return "failed";
    case JobState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto
is_terminal(JobState state) -> bool
{
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

[[nodiscard]] constexpr auto
holds_reservation(JobState state) -> bool
{
  return state == JobState::Admitted || state == JobState::Running;
}

}  // namespace gpusched
