#include "scheduler.hpp"

#include <algorithm>
#include <exception>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace gpusched {

namespace {
constexpr std::string_view kForceReleaseReason =
    "reservation force-released by operator";

auto
unknown_job(std::string_view job_id) -> UnknownJobException
{
  return UnknownJobException("Unknown job id " + std::string(job_id));
}

auto
seconds_between(Clock::time_point from, Clock::time_point to) -> double
{
  return std::chrono::duration<double>(to - from).count();
}
}  // namespace

Scheduler::Scheduler(
    DeviceRegistry& registry, AllocationLedger& ledger,
    VramOptimizer& optimizer, JobQueue& queue, const VramEstimator& estimator,
    SchedulerOptions options, ClockFn clock)
    : registry_(&registry), ledger_(&ledger), optimizer_(&optimizer),
      queue_(&queue), estimator_(&estimator), options_(options),
      clock_(clock ? std::move(clock) : default_clock())
{
  if (options_.max_admission_attempts == 0) {
    options_.max_admission_attempts = 1;
  }
  listener_token_ = registry_->add_health_listener(
      [this](DeviceId device_id, bool healthy, const std::string& reason) {
        on_health_change(device_id, healthy, reason);
      });
}

Scheduler::~Scheduler()
{
  registry_->remove_health_listener(listener_token_);
}

void
Scheduler::set_executor_hooks(std::shared_ptr<ExecutorHooks> hooks)
{
  const std::scoped_lock lock(hooks_mutex_);
  hooks_ = std::move(hooks);
}

// =============================================================================
// Admission
// =============================================================================

auto
Scheduler::ranked_devices_locked(Bytes vram_bytes) const
    -> std::vector<DeviceId>
{
  struct Candidate {
    DeviceId id;
    Bytes free;
    double utilization;
  };
  std::vector<Candidate> candidates;
  for (const auto& device : registry_->list_devices()) {
    if (!device.healthy) {
      continue;
    }
    const Bytes free = ledger_->free_vram(device.id);
    if (free >= vram_bytes) {
      candidates.push_back({device.id, free, device.utilization_pct});
    }
  }
  std::ranges::sort(candidates, [](const auto& lhs, const auto& rhs) {
    if (lhs.free != rhs.free) {
      return lhs.free > rhs.free;
    }
    if (lhs.utilization != rhs.utilization) {
      return lhs.utilization < rhs.utilization;
    }
    return lhs.id < rhs.id;
  });
  std::vector<DeviceId> ranked;
  ranked.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    ranked.push_back(candidate.id);
  }
  return ranked;
}

auto
Scheduler::select_device(Bytes vram_bytes) const -> std::optional<DeviceId>
{
  const std::scoped_lock lock(mutex_);
  auto ranked = ranked_devices_locked(vram_bytes);
  if (ranked.empty()) {
    return std::nullopt;
  }
  return ranked.front();
}

auto
Scheduler::evict_for_locked(Bytes vram_bytes) -> std::optional<DeviceId>
{
  struct Target {
    DeviceId id;
    Bytes free;
  };
  std::vector<Target> targets;
  for (const auto& device : registry_->list_devices()) {
    if (device.healthy && device.total_vram >= vram_bytes) {
      targets.push_back({device.id, ledger_->free_vram(device.id)});
    }
  }
  std::ranges::sort(targets, [](const auto& lhs, const auto& rhs) {
    if (lhs.free != rhs.free) {
      return lhs.free > rhs.free;
    }
    return lhs.id < rhs.id;
  });
  for (const auto& target : targets) {
    if (optimizer_->try_free_capacity(target.id, vram_bytes)) {
      return target.id;
    }
  }
  return std::nullopt;
}

auto
Scheduler::fits_any_device_locked(Bytes vram_bytes) const -> bool
{
  const auto devices = registry_->list_devices();
  return std::ranges::any_of(devices, [vram_bytes](const auto& device) {
    return device.total_vram >= vram_bytes;
  });
}

auto
Scheduler::try_admit_locked(Job& job, Events& events)
    -> std::optional<DeviceId>
{
  const Bytes need = job.vram_estimate;
  bool eviction_tried = false;

  for (std::size_t attempt = 0; attempt < options_.max_admission_attempts;
       ++attempt) {
    std::optional<DeviceId> device;
    if (auto ranked = ranked_devices_locked(need); !ranked.empty()) {
      device = ranked.front();
    } else if (!eviction_tried) {
      eviction_tried = true;
      device = evict_for_locked(need);
    }

    if (!device) {
      const auto devices = registry_->list_devices();
      const bool blocked_by_health =
          std::ranges::any_of(devices, [this, need](const auto& candidate) {
            return !candidate.healthy &&
                   ledger_->free_vram(candidate.id) >= need;
          });
      if (blocked_by_health) {
        const DeviceUnhealthyException reason(
            "Job " + job.id + " only fits on quarantined devices");
        log_debug(options_.verbosity, reason.what());
      }
      return std::nullopt;
    }

    try {
      ledger_->try_reserve(*device, job.id, need, job.priority_tier);
    }
    catch (const InsufficientCapacityException& e) {
      log_debug(
          options_.verbosity, "Admission attempt " +
                                  std::to_string(attempt + 1) + " for job " +
                                  job.id + " lost its slot: " + e.what());
      continue;
    }

    job.state = JobState::Admitted;
    job.device_id = *device;
    job.failure_reason.clear();
    if (optimizer_->pin(*device, job.model_name())) {
      pinned_jobs_.insert(job.id);
    }
    log_info(
        options_.verbosity, "Admitted job " + job.id + " (" +
                                std::to_string(need) + " bytes, " +
                                std::string(to_string(job.priority_tier)) +
                                ") on GPU " + std::to_string(*device));
    events.push_back({HookEvent::Type::Admitted, job, *device, {}});
    return device;
  }
  return std::nullopt;
}

// =============================================================================
// Lifecycle
// =============================================================================

auto
Scheduler::find_locked(std::string_view job_id) const -> std::shared_ptr<Job>
{
  auto iter = jobs_.find(job_id);
  return iter == jobs_.end() ? nullptr : iter->second;
}

void
Scheduler::release_locked(Job& job)
{
  ledger_->release(job.id);
  if (pinned_jobs_.erase(job.id) > 0 && job.device_id) {
    optimizer_->unpin(*job.device_id, job.model_name());
  }
}

void
Scheduler::finish_locked(
    Job& job, JobState state, std::string reason, std::string_view outcome,
    Events& events, bool notify_executor)
{
  job.state = state;
  job.failure_reason = std::move(reason);
  increment_jobs_finished(outcome);
  if (state == JobState::Failed && notify_executor) {
    log_warning("Job " + job.id + " failed: " + job.failure_reason);
    events.push_back(
        {HookEvent::Type::Failed, job, job.device_id.value_or(-1),
         job.failure_reason});
  }

  finished_jobs_.push_back(job.id);
  while (finished_jobs_.size() > options_.finished_job_retention) {
    jobs_.erase(finished_jobs_.front());
    finished_jobs_.pop_front();
  }
}

auto
Scheduler::submit(Job job) -> JobId
{
  Events events;
  JobId job_id;
  {
    const std::scoped_lock lock(mutex_);
    if (job.id.empty()) {
      do {
        job.id = "job-" + std::to_string(++next_job_number_);
      } while (jobs_.contains(job.id));
    } else if (jobs_.contains(job.id)) {
      throw InvalidJobException("Duplicate job id " + job.id);
    }
    if (job.model_name().empty()) {
      throw InvalidJobException("Job " + job.id + " does not name a model");
    }
    if (job.vram_estimate == 0) {
      job.vram_estimate = estimator_->estimate(job);
    }
    if (job.vram_estimate == 0) {
      throw InvalidJobException("Job " + job.id + " has no VRAM estimate");
    }

    const auto now = clock_();
    job.state = JobState::Queued;
    job.submitted_at = now;
    job.queued_at = now;
    job.device_id.reset();
    job.failure_reason.clear();

    auto shared = std::make_shared<Job>(std::move(job));
    job_id = shared->id;
    jobs_.emplace(job_id, shared);
    increment_jobs_submitted(to_string(shared->kind()));

    if (!fits_any_device_locked(shared->vram_estimate)) {
      log_warning(
          "Job " + job_id + " needs " +
          std::to_string(shared->vram_estimate) +
          " bytes, more than any device holds; it will wait until timeout");
    }

    if (!try_admit_locked(*shared, events)) {
      if (queue_->enqueue(shared)) {
        log_debug(
            options_.verbosity,
            "Queued job " + job_id + " in tier " +
                std::string(to_string(shared->priority_tier)));
      } else {
        const QueueFullException reason(
            "Queue tier " + std::string(to_string(shared->priority_tier)) +
            " is full (" +
            std::to_string(queue_->capacity(shared->priority_tier)) +
            " jobs)");
        finish_locked(
            *shared, JobState::Failed, reason.what(), "failed", events);
      }
    }
  }
  dispatch(events);
  return job_id;
}

void
Scheduler::start(std::string_view job_id)
{
  const std::scoped_lock lock(mutex_);
  auto job = find_locked(job_id);
  if (!job) {
    throw unknown_job(job_id);
  }
  if (job->state == JobState::Running) {
    return;
  }
  if (job->state != JobState::Admitted) {
    throw InvalidJobTransitionException(
        "Job " + job->id + " cannot start from state " +
        std::string(to_string(job->state)));
  }
  job->state = JobState::Running;
  log_trace(options_.verbosity, "Job " + job->id + " running");
}

auto
Scheduler::complete(
    std::string_view job_id, bool success, const std::string& reason,
    std::optional<DeviceId> device_id) -> bool
{
  Events events;
  bool released = false;
  {
    const std::scoped_lock lock(mutex_);
    auto job = find_locked(job_id);
    if (!job) {
      throw unknown_job(job_id);
    }
    if (device_id && job->device_id && *job->device_id != *device_id) {
      log_debug(
          options_.verbosity,
          "Ignoring stale report for job " + job->id + " from GPU " +
              std::to_string(*device_id) + "; job now holds GPU " +
              std::to_string(*job->device_id));
      return false;
    }
    if (holds_reservation(job->state)) {
      release_locked(*job);
      released = true;
      if (success) {
        finish_locked(*job, JobState::Completed, {}, "completed", events);
      } else {
        finish_locked(
            *job, JobState::Failed,
            reason.empty() ? std::string("executor reported failure") : reason,
            "failed", events, false);
      }
      log_info(
          options_.verbosity,
          "Job " + job->id + " " + std::string(to_string(job->state)));
    } else if (job->state == JobState::Queued) {
      // Displaced by failover while its original run carried on.
      if (!success) {
        log_debug(
            options_.verbosity,
            "Ignoring failure report for requeued job " + job->id);
        return false;
      }
      queue_->remove(job->id);
      finish_locked(*job, JobState::Completed, {}, "completed", events);
    } else {
      log_debug(
          options_.verbosity, "Job " + job->id + " already " +
                                  std::string(to_string(job->state)));
      return false;
    }
  }
  dispatch(events);
  if (released) {
    drain();
  }
  return true;
}

auto
Scheduler::cancel(std::string_view job_id) -> bool
{
  Events events;
  bool released = false;
  {
    const std::scoped_lock lock(mutex_);
    auto job = find_locked(job_id);
    if (!job) {
      throw unknown_job(job_id);
    }
    if (job->state == JobState::Queued) {
      queue_->remove(job->id);
      finish_locked(*job, JobState::Cancelled, {}, "cancelled", events);
    } else if (holds_reservation(job->state)) {
      const DeviceId device_id = job->device_id.value_or(-1);
      release_locked(*job);
      released = true;
      finish_locked(*job, JobState::Cancelled, {}, "cancelled", events);
      events.push_back(
          {HookEvent::Type::CancelRequested, *job, device_id, {}});
    } else {
      return false;
    }
    log_info(options_.verbosity, "Cancelled job " + job->id);
  }
  dispatch(events);
  if (released) {
    drain();
  }
  return true;
}

auto
Scheduler::force_release(std::string_view job_id) -> bool
{
  Events events;
  {
    const std::scoped_lock lock(mutex_);
    auto job = find_locked(job_id);
    if (!job) {
      throw unknown_job(job_id);
    }
    if (!holds_reservation(job->state)) {
      return false;
    }
    const DeviceId device_id = job->device_id.value_or(-1);
    release_locked(*job);
    log_warning(
        "Operator force-released job " + job->id + " on GPU " +
        std::to_string(device_id));
    events.push_back({HookEvent::Type::CancelRequested, *job, device_id, {}});
    finish_locked(
        *job, JobState::Failed, std::string(kForceReleaseReason), "failed",
        events);
  }
  dispatch(events);
  drain();
  return true;
}

auto
Scheduler::quarantine_device(DeviceId device_id, const std::string& reason)
    -> bool
{
  return registry_->mark_unhealthy(
      device_id, reason.empty() ? std::string("quarantined by operator")
                                : reason);
}

auto
Scheduler::restore_device(DeviceId device_id) -> bool
{
  return registry_->mark_healthy(device_id);
}

// =============================================================================
// Failover and draining
// =============================================================================

void
Scheduler::on_health_change(
    DeviceId device_id, bool healthy, const std::string& reason)
{
  if (healthy) {
    drain();
  } else {
    fail_over(device_id, reason);
  }
}

void
Scheduler::fail_over(DeviceId device_id, const std::string& reason)
{
  Events events;
  {
    const std::scoped_lock lock(mutex_);
    const auto released = ledger_->release_device(device_id);
    const auto now = clock_();
    // Newest first, so the oldest displaced job ends up at the head.
    for (const auto& reservation : std::views::reverse(released)) {
      auto job = find_locked(reservation.job_id);
      if (!job || !holds_reservation(job->state)) {
        continue;
      }
      if (pinned_jobs_.erase(job->id) > 0) {
        optimizer_->unpin(device_id, job->model_name());
      }
      job->state = JobState::Queued;
      job->device_id.reset();
      job->queued_at = now;
      queue_->requeue_front(job);
      events.push_back(
          {HookEvent::Type::CancelRequested, *job, device_id, {}});
    }
    log_warning(
        "Failover of GPU " + std::to_string(device_id) + " (" + reason +
        "): requeued " + std::to_string(released.size()) + " job(s)");
    increment_failovers();
  }
  dispatch(events);
  drain();
}

void
Scheduler::drain()
{
  Events events;
  {
    const std::scoped_lock lock(mutex_);
    const auto now = clock_();
    for (const auto tier : kTierOrder) {
      std::size_t skipped = 0;
      for (const auto& job : queue_->peek(tier, queue_->depth(tier))) {
        if (job->state != JobState::Queued) {
          continue;
        }
        if (try_admit_locked(*job, events)) {
          queue_->remove(job->id);
          observe_queue_wait(
              to_string(tier), seconds_between(job->queued_at, now));
          continue;
        }
        if (++skipped >= options_.drain_skip_limit) {
          break;
        }
      }
    }
  }
  dispatch(events);
}

auto
Scheduler::expire_queued() -> std::size_t
{
  if (options_.queue_timeout.count() <= 0) {
    return 0;
  }
  Events events;
  std::size_t expired_count = 0;
  {
    const std::scoped_lock lock(mutex_);
    const auto now = clock_();
    const auto expired = queue_->take_expired(now - options_.queue_timeout);
    for (const auto& job : expired) {
      const QueueTimeoutException reason(
          "Job " + job->id + " waited more than " +
          std::to_string(options_.queue_timeout.count()) + " s in the queue");
      finish_locked(*job, JobState::Failed, reason.what(), "timeout", events);
    }
    expired_count = expired.size();
  }
  dispatch(events);
  return expired_count;
}

auto
Scheduler::sweep() -> std::size_t
{
  const auto expired = expire_queued();
  drain();
  return expired;
}

// =============================================================================
// Views
// =============================================================================

auto
Scheduler::status(std::string_view job_id) const -> JobState
{
  const std::scoped_lock lock(mutex_);
  auto job = find_locked(job_id);
  if (!job) {
    throw unknown_job(job_id);
  }
  return job->state;
}

auto
Scheduler::describe(std::string_view job_id) const -> std::optional<Job>
{
  const std::scoped_lock lock(mutex_);
  auto job = find_locked(job_id);
  if (!job) {
    return std::nullopt;
  }
  return *job;
}

auto
Scheduler::estimate_wait(std::string_view job_id) const
    -> std::optional<WaitEstimate>
{
  const std::scoped_lock lock(mutex_);
  auto job = find_locked(job_id);
  if (!job || job->state != JobState::Queued) {
    return std::nullopt;
  }
  auto position = queue_->position(job_id);
  if (!position) {
    return std::nullopt;
  }
  WaitEstimate estimate;
  estimate.waited = std::chrono::duration_cast<std::chrono::seconds>(
      clock_() - job->queued_at);
  estimate.position = *position;
  return estimate;
}

auto
Scheduler::device_table() const -> std::vector<DeviceStatus>
{
  const std::scoped_lock lock(mutex_);
  std::vector<DeviceStatus> table;
  for (const auto& device : registry_->list_devices()) {
    DeviceStatus row;
    row.id = device.id;
    row.name = device.name;
    row.total_vram = device.total_vram;
    row.reserved_vram = ledger_->reserved_vram(device.id);
    row.resident_vram = ledger_->resident_vram(device.id);
    row.used_vram = std::max(
        row.reserved_vram + row.resident_vram, device.external_used_vram);
    row.free_vram = ledger_->free_vram(device.id);
    row.utilization_pct = device.utilization_pct;
    row.temperature_c = device.temperature_c;
    row.healthy = device.healthy;
    row.unhealthy_reason = device.unhealthy_reason;
    row.active_reservations = ledger_->reservations_on(device.id).size();
    row.nvlink_peers = device.nvlink_peers;

    publish_device_gauges(DeviceGaugeSample{
        row.id, static_cast<double>(row.total_vram),
        static_cast<double>(row.reserved_vram),
        static_cast<double>(row.free_vram), row.utilization_pct,
        row.temperature_c, row.healthy});
    table.push_back(std::move(row));
  }
  return table;
}

auto
Scheduler::queue_depths() const -> std::array<std::size_t, kTierCount>
{
  return queue_->depths();
}

auto
Scheduler::queue_status() const -> std::vector<TierStatus>
{
  const std::scoped_lock lock(mutex_);
  std::vector<TierStatus> result;
  const auto depths = queue_->depths();
  for (const auto tier : kTierOrder) {
    result.push_back({tier, depths[tier_index(tier)], 0});
  }
  for (const auto& [id, job] : jobs_) {
    if (holds_reservation(job->state)) {
      ++result[tier_index(job->priority_tier)].active;
    }
  }
  return result;
}

auto
Scheduler::shutdown() -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  const auto in_flight = ledger_->reservations();
  for (const auto& reservation : in_flight) {
    log_warning(
        "Reservation lost at shutdown: job " + reservation.job_id + " held " +
        std::to_string(reservation.vram_bytes) + " bytes on GPU " +
        std::to_string(reservation.device_id));
  }
  if (!in_flight.empty()) {
    log_warning_critical(
        std::to_string(in_flight.size()) +
        " in-flight reservation(s) lost at shutdown");
  }
  return in_flight.size();
}

void
Scheduler::dispatch(const Events& events) const
{
  if (events.empty()) {
    return;
  }
  std::shared_ptr<ExecutorHooks> hooks;
  {
    const std::scoped_lock lock(hooks_mutex_);
    hooks = hooks_;
  }
  if (!hooks) {
    return;
  }
  for (const auto& event : events) {
    try {
      switch (event.type) {
        case HookEvent::Type::Admitted:
          hooks->on_admitted(event.job, event.device_id);
          break;
        case HookEvent::Type::CancelRequested:
          hooks->on_cancel_requested(event.job.id, event.device_id);
          break;
        case HookEvent::Type::Failed:
          hooks->on_failed(event.job, event.reason);
          break;
      }
    }
    catch (const std::exception& e) {
      log_error(
          "Executor hook failed for job " + event.job.id + ": " + e.what());
    }
  }
}

}  // namespace gpusched
