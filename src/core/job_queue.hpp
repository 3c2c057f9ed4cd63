#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "job.hpp"
#include "scheduling_types.hpp"

namespace gpusched {

// 0 means the tier is unbounded.
using TierCapacities = std::array<std::size_t, kTierCount>;

inline constexpr TierCapacities kDefaultTierCapacities{100, 200, 500, 1000};

// =============================================================================
// Thread-safe priority queue of waiting jobs
// -----------------------------------------------------------------------------
// One FIFO per tier. dequeue() always serves the highest non-empty tier; a
// lower tier is never served while a higher one holds work.
// =============================================================================

class JobQueue {
 public:
  explicit JobQueue(TierCapacities capacities = kDefaultTierCapacities);

  // Appends to the job's tier. False when the tier is full or job is null.
  [[nodiscard]] auto enqueue(std::shared_ptr<Job> job) -> bool;
  // Puts a job back at the head of its tier, ignoring the capacity bound.
  void requeue_front(std::shared_ptr<Job> job);

  [[nodiscard]] auto dequeue() -> std::shared_ptr<Job>;
  auto remove(std::string_view job_id) -> std::shared_ptr<Job>;

  [[nodiscard]] auto peek(PriorityTier tier, std::size_t max_items) const
      -> std::vector<std::shared_ptr<Job>>;
  [[nodiscard]] auto depth(PriorityTier tier) const -> std::size_t;
  [[nodiscard]] auto depths() const -> std::array<std::size_t, kTierCount>;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }
  [[nodiscard]] auto contains(std::string_view job_id) const -> bool;
  [[nodiscard]] auto is_full(PriorityTier tier) const -> bool;
  [[nodiscard]] auto capacity(PriorityTier tier) const -> std::size_t;

  // Zero-based rank among all jobs that dequeue() would serve first.
  [[nodiscard]] auto position(std::string_view job_id) const
      -> std::optional<std::size_t>;

  // Removes and returns every job queued at or before `cutoff`.
  auto take_expired(Clock::time_point cutoff)
      -> std::vector<std::shared_ptr<Job>>;

 private:
  void publish_depth_locked(PriorityTier tier) const;

  TierCapacities capacities_;
  mutable std::mutex mutex_;
  std::array<std::deque<std::shared_ptr<Job>>, kTierCount> tiers_;
};

}  // namespace gpusched
