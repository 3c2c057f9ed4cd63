#include "job_queue.hpp"

#include <algorithm>
#include <utility>

#include "monitoring/metrics.hpp"

namespace gpusched {

JobQueue::JobQueue(TierCapacities capacities) : capacities_(capacities)
{
  for (const auto tier : kTierOrder) {
    set_queue_depth(to_string(tier), 0);
  }
}

void
JobQueue::publish_depth_locked(PriorityTier tier) const
{
  set_queue_depth(to_string(tier), tiers_[tier_index(tier)].size());
}

auto
JobQueue::enqueue(std::shared_ptr<Job> job) -> bool
{
  if (job == nullptr) {
    return false;
  }
  const auto tier = job->priority_tier;
  const std::scoped_lock lock(mutex_);
  auto& fifo = tiers_[tier_index(tier)];
  const auto limit = capacities_[tier_index(tier)];
  if (limit != 0 && fifo.size() >= limit) {
    return false;
  }
  fifo.push_back(std::move(job));
  publish_depth_locked(tier);
  return true;
}

void
JobQueue::requeue_front(std::shared_ptr<Job> job)
{
  if (job == nullptr) {
    return;
  }
  const auto tier = job->priority_tier;
  const std::scoped_lock lock(mutex_);
  tiers_[tier_index(tier)].push_front(std::move(job));
  publish_depth_locked(tier);
}

auto
JobQueue::dequeue() -> std::shared_ptr<Job>
{
  const std::scoped_lock lock(mutex_);
  for (const auto tier : kTierOrder) {
    auto& fifo = tiers_[tier_index(tier)];
    if (!fifo.empty()) {
      auto job = std::move(fifo.front());
      fifo.pop_front();
      publish_depth_locked(tier);
      return job;
    }
  }
  return nullptr;
}

auto
JobQueue::remove(std::string_view job_id) -> std::shared_ptr<Job>
{
  const std::scoped_lock lock(mutex_);
  for (const auto tier : kTierOrder) {
    auto& fifo = tiers_[tier_index(tier)];
    auto iter = std::ranges::find_if(
        fifo, [job_id](const auto& job) { return job->id == job_id; });
    if (iter != fifo.end()) {
      auto job = std::move(*iter);
      fifo.erase(iter);
      publish_depth_locked(tier);
      return job;
    }
  }
  return nullptr;
}

auto
JobQueue::peek(PriorityTier tier, std::size_t max_items) const
    -> std::vector<std::shared_ptr<Job>>
{
  const std::scoped_lock lock(mutex_);
  const auto& fifo = tiers_[tier_index(tier)];
  const auto count = std::min(max_items, fifo.size());
  return std::vector<std::shared_ptr<Job>>(
      fifo.begin(), fifo.begin() + static_cast<std::ptrdiff_t>(count));
}

auto
JobQueue::depth(PriorityTier tier) const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return tiers_[tier_index(tier)].size();
}

auto
JobQueue::depths() const -> std::array<std::size_t, kTierCount>
{
  const std::scoped_lock lock(mutex_);
  std::array<std::size_t, kTierCount> result{};
  for (std::size_t idx = 0; idx < kTierCount; ++idx) {
    result[idx] = tiers_[idx].size();
  }
  return result;
}

auto
JobQueue::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  std::size_t total = 0;
  for (const auto& fifo : tiers_) {
    total += fifo.size();
  }
  return total;
}

auto
JobQueue::contains(std::string_view job_id) const -> bool
{
  return position(job_id).has_value();
}

auto
JobQueue::is_full(PriorityTier tier) const -> bool
{
  const std::scoped_lock lock(mutex_);
  const auto limit = capacities_[tier_index(tier)];
  return limit != 0 && tiers_[tier_index(tier)].size() >= limit;
}

auto
JobQueue::capacity(PriorityTier tier) const -> std::size_t
{
  return capacities_[tier_index(tier)];
}

auto
JobQueue::position(std::string_view job_id) const -> std::optional<std::size_t>
{
  const std::scoped_lock lock(mutex_);
  std::size_t ahead = 0;
  for (const auto& fifo : tiers_) {
    for (const auto& job : fifo) {
      if (job->id == job_id) {
        return ahead;
      }
      ++ahead;
    }
  }
  return std::nullopt;
}

auto
JobQueue::take_expired(Clock::time_point cutoff)
    -> std::vector<std::shared_ptr<Job>>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::shared_ptr<Job>> expired;
  for (const auto tier : kTierOrder) {
    auto& fifo = tiers_[tier_index(tier)];
    const auto before = fifo.size();
    std::erase_if(fifo, [&](const auto& job) {
      if (job->queued_at <= cutoff) {
        expired.push_back(job);
        return true;
      }
      return false;
    });
    if (fifo.size() != before) {
      publish_depth_locked(tier);
    }
  }
  return expired;
}

}  // namespace gpusched
