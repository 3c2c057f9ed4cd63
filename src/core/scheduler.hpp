#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "allocation_ledger.hpp"
#include "device_registry.hpp"
#include "job.hpp"
#include "job_queue.hpp"
#include "scheduling_types.hpp"
#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"
#include "vram_estimator.hpp"
#include "vram_optimizer.hpp"

namespace gpusched {

inline constexpr std::size_t kDefaultMaxAdmissionAttempts = 3;
inline constexpr std::size_t kDefaultDrainSkipLimit = 8;
inline constexpr std::chrono::seconds kDefaultQueueTimeout{600};
inline constexpr std::size_t kDefaultFinishedJobRetention = 10000;

struct SchedulerOptions {
  std::size_t max_admission_attempts = kDefaultMaxAdmissionAttempts;
  std::size_t drain_skip_limit = kDefaultDrainSkipLimit;
  // Zero disables queue timeouts.
  std::chrono::seconds queue_timeout = kDefaultQueueTimeout;
  std::size_t finished_job_retention = kDefaultFinishedJobRetention;
  VerbosityLevel verbosity = VerbosityLevel::Silent;
};

// =============================================================================
// ExecutorHooks
// -----------------------------------------------------------------------------
// Callbacks into whoever runs the GPU work. Always invoked after every
// scheduler lock has been released. Cancellation is cooperative: by the time
// on_cancel_requested fires the reservation is already gone.
// =============================================================================

class ExecutorHooks {
 public:
  ExecutorHooks() = default;
  ExecutorHooks(const ExecutorHooks&) = delete;
  auto operator=(const ExecutorHooks&) -> ExecutorHooks& = delete;
  ExecutorHooks(ExecutorHooks&&) = delete;
  auto operator=(ExecutorHooks&&) -> ExecutorHooks& = delete;
  virtual ~ExecutorHooks() = default;

  virtual void on_admitted(const Job& job, DeviceId device_id) = 0;
  virtual void on_cancel_requested(const JobId& job_id, DeviceId device_id) = 0;
  virtual void on_failed(const Job& job, const std::string& reason) = 0;
};

// Row of the operational device table.
struct DeviceStatus {
  DeviceId id = 0;
  std::string name;
  Bytes total_vram = 0;
  Bytes reserved_vram = 0;
  Bytes resident_vram = 0;
  Bytes used_vram = 0;
  Bytes free_vram = 0;
  double utilization_pct = 0.0;
  double temperature_c = 0.0;
  bool healthy = true;
  std::string unhealthy_reason;
  std::size_t active_reservations = 0;
  std::set<DeviceId> nvlink_peers;
};

struct TierStatus {
  PriorityTier tier = PriorityTier::Normal;
  std::size_t queued = 0;
  std::size_t active = 0;
};

struct WaitEstimate {
  std::chrono::seconds waited{0};
  // Jobs dequeue() would serve before this one.
  std::size_t position = 0;
};

// =============================================================================
// Scheduler
// -----------------------------------------------------------------------------
// Admission, lifecycle and queue draining. Every admission decision is taken
// under one scheduler mutex so that the device scan, any eviction and the
// ledger commit form a single consistent step. Lock order is
//   Scheduler -> VramOptimizer -> AllocationLedger -> DeviceRegistry.
// Draining runs as its own pass once the releasing operation has finished.
// =============================================================================

class Scheduler {
 public:
  Scheduler(
      DeviceRegistry& registry, AllocationLedger& ledger,
      VramOptimizer& optimizer, JobQueue& queue,
      const VramEstimator& estimator, SchedulerOptions options = {},
      ClockFn clock = default_clock());
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;
  Scheduler(Scheduler&&) = delete;
  auto operator=(Scheduler&&) -> Scheduler& = delete;

  void set_executor_hooks(std::shared_ptr<ExecutorHooks> hooks);

  // Accepts the job and tries to admit it at once; otherwise queues it.
  // Throws InvalidJobException only for malformed submissions.
  auto submit(Job job) -> JobId;

  // Healthy device a job of `vram_bytes` would be admitted to right now,
  // without eviction.
  [[nodiscard]] auto select_device(Bytes vram_bytes) const
      -> std::optional<DeviceId>;

  void start(std::string_view job_id);
  // `device_id` names the GPU the report comes from. A report from a device
  // other than the one the job currently holds is stale and ignored.
  auto complete(
      std::string_view job_id, bool success, const std::string& reason = {},
      std::optional<DeviceId> device_id = std::nullopt) -> bool;
  auto cancel(std::string_view job_id) -> bool;

  // Operator surface.
  auto force_release(std::string_view job_id) -> bool;
  auto quarantine_device(DeviceId device_id, const std::string& reason) -> bool;
  auto restore_device(DeviceId device_id) -> bool;

  // Admits queued work in tier order while it fits.
  void drain();
  // Fails every job queued longer than the configured timeout.
  auto expire_queued() -> std::size_t;
  // Periodic pass: expires overdue jobs, then drains. Picks up capacity freed
  // outside the scheduler (lower external usage, unloads, rebalance
  // evictions). Returns the number of expired jobs.
  auto sweep() -> std::size_t;

  [[nodiscard]] auto status(std::string_view job_id) const -> JobState;
  [[nodiscard]] auto describe(std::string_view job_id) const
      -> std::optional<Job>;
  [[nodiscard]] auto estimate_wait(std::string_view job_id) const
      -> std::optional<WaitEstimate>;
  [[nodiscard]] auto device_table() const -> std::vector<DeviceStatus>;
  [[nodiscard]] auto queue_depths() const -> std::array<std::size_t, kTierCount>;
  [[nodiscard]] auto queue_status() const -> std::vector<TierStatus>;

  // Logs every reservation still held; they are lost with the process.
  auto shutdown() -> std::size_t;

 private:
  struct HookEvent {
    enum class Type : std::uint8_t { Admitted, CancelRequested, Failed };
    Type type;
    Job job;
    DeviceId device_id = 0;
    std::string reason;
  };
  using Events = std::vector<HookEvent>;

  void on_health_change(
      DeviceId device_id, bool healthy, const std::string& reason);
  void fail_over(DeviceId device_id, const std::string& reason);

  [[nodiscard]] auto find_locked(std::string_view job_id) const
      -> std::shared_ptr<Job>;
  [[nodiscard]] auto ranked_devices_locked(Bytes vram_bytes) const
      -> std::vector<DeviceId>;
  auto evict_for_locked(Bytes vram_bytes) -> std::optional<DeviceId>;
  auto try_admit_locked(Job& job, Events& events) -> std::optional<DeviceId>;
  void release_locked(Job& job);
  void finish_locked(
      Job& job, JobState state, std::string reason, std::string_view outcome,
      Events& events, bool notify_executor = true);
  [[nodiscard]] auto fits_any_device_locked(Bytes vram_bytes) const -> bool;
  void dispatch(const Events& events) const;

  DeviceRegistry* registry_;
  AllocationLedger* ledger_;
  VramOptimizer* optimizer_;
  JobQueue* queue_;
  const VramEstimator* estimator_;
  SchedulerOptions options_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  std::unordered_map<JobId, std::shared_ptr<Job>, TransparentHash, std::equal_to<>>
      jobs_;
  std::unordered_set<JobId, TransparentHash, std::equal_to<>> pinned_jobs_;
  std::deque<JobId> finished_jobs_;
  std::uint64_t next_job_number_ = 0;

  mutable std::mutex hooks_mutex_;
  std::shared_ptr<ExecutorHooks> hooks_;

  DeviceRegistry::ListenerToken listener_token_;
};

}  // namespace gpusched
