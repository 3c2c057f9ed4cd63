#include "monitoring/metrics.hpp"

#include <prometheus/exposer.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "utils/logger.hpp"

namespace gpusched {

class PrometheusExposerHandle : public MetricsRegistry::ExposerHandle {
 public:
  explicit PrometheusExposerHandle(std::unique_ptr<prometheus::Exposer> exposer)
      : exposer_(std::move(exposer))
  {
  }

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RegisterCollectable(collectable);
  }

  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RemoveCollectable(collectable);
  }

 private:
  std::unique_ptr<prometheus::Exposer> exposer_;
};

namespace {
const prometheus::Histogram::BucketBoundaries kQueueWaitSecondsBuckets{
    1, 5, 10, 30, 60, 120, 300, 600};

template <typename Metric, typename Map, typename Family>
auto
labelled_metric(
    Map& metrics, Family* family, const std::string& label_name,
    std::string_view label_value) -> Metric*
{
  auto iter = metrics.find(label_value);
  if (iter == metrics.end()) {
    auto* metric =
        &family->Add({{label_name, std::string(label_value)}});
    iter = metrics.emplace(std::string(label_value), metric).first;
  }
  return iter->second;
}
}  // namespace

MetricsRegistry::MetricsRegistry(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
    : registry(std::make_shared<prometheus::Registry>()),
      evictions_total(nullptr), failovers_total(nullptr), exposer_(nullptr)
{
  initialize(port, std::move(exposer_handle));
}

void
MetricsRegistry::initialize(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
{
  try {
    if (!exposer_handle) {
      auto exposer = std::make_unique<prometheus::Exposer>(
          "0.0.0.0:" + std::to_string(port));
      exposer_handle =
          std::make_unique<PrometheusExposerHandle>(std::move(exposer));
    }
    exposer_handle->RegisterCollectable(registry);
    exposer_ = std::move(exposer_handle);
  }
  catch (const std::exception& e) {
    log_error(std::string("Failed to initialize metrics exposer: ") + e.what());
    throw;
  }

  vram_total_family_ = &prometheus::BuildGauge()
                            .Name("gpu_vram_total_bytes")
                            .Help("Total VRAM in bytes per GPU")
                            .Register(*registry);
  vram_reserved_family_ = &prometheus::BuildGauge()
                               .Name("gpu_vram_reserved_bytes")
                               .Help("VRAM reserved by admitted jobs per GPU")
                               .Register(*registry);
  vram_free_family_ = &prometheus::BuildGauge()
                           .Name("gpu_vram_free_bytes")
                           .Help("VRAM available for admission per GPU")
                           .Register(*registry);
  utilization_family_ = &prometheus::BuildGauge()
                             .Name("gpu_utilization_percent")
                             .Help("GPU utilization percentage per GPU (0-100)")
                             .Register(*registry);
  temperature_family_ = &prometheus::BuildGauge()
                             .Name("gpu_temperature_celsius")
                             .Help("GPU temperature in degrees Celsius")
                             .Register(*registry);
  healthy_family_ = &prometheus::BuildGauge()
                         .Name("gpu_healthy")
                         .Help("1 when the GPU accepts work, 0 when quarantined")
                         .Register(*registry);
  queue_depth_family_ = &prometheus::BuildGauge()
                             .Name("scheduler_queue_depth")
                             .Help("Number of queued jobs per priority tier")
                             .Register(*registry);
  submitted_family_ = &prometheus::BuildCounter()
                           .Name("scheduler_jobs_submitted_total")
                           .Help("Jobs submitted per job kind")
                           .Register(*registry);
  finished_family_ = &prometheus::BuildCounter()
                          .Name("scheduler_jobs_finished_total")
                          .Help("Jobs that reached a terminal state")
                          .Register(*registry);
  queue_wait_family_ = &prometheus::BuildHistogram()
                            .Name("scheduler_queue_wait_seconds")
                            .Help("Time spent queued before admission")
                            .Register(*registry);
  device_errors_family_ = &prometheus::BuildCounter()
                               .Name("gpu_errors_total")
                               .Help("Device errors reported by executors")
                               .Register(*registry);

  auto& eviction_family = prometheus::BuildCounter()
                              .Name("gpu_evictions_total")
                              .Help("Idle resident models evicted")
                              .Register(*registry);
  evictions_total = &eviction_family.Add({});

  auto& failover_family = prometheus::BuildCounter()
                              .Name("gpu_failovers_total")
                              .Help("Device failovers performed")
                              .Register(*registry);
  failovers_total = &failover_family.Add({});
}

MetricsRegistry::~MetricsRegistry() noexcept
{
  if (exposer_ && registry) {
    try {
      exposer_->RemoveCollectable(registry);
    }
    catch (const std::exception& e) {
      log_error(
          std::string("Failed to remove metrics registry collectable: ") +
          e.what());
    }
  }
}

auto
MetricsRegistry::device_gauges_locked(int device_id) -> DeviceGauges&
{
  auto [iter, inserted] = device_gauges_.try_emplace(device_id);
  if (inserted) {
    const prometheus::Labels labels{{"gpu", std::to_string(device_id)}};
    auto& gauges = iter->second;
    gauges.total = &vram_total_family_->Add(labels);
    gauges.reserved = &vram_reserved_family_->Add(labels);
    gauges.free = &vram_free_family_->Add(labels);
    gauges.utilization = &utilization_family_->Add(labels);
    gauges.temperature = &temperature_family_->Add(labels);
    gauges.healthy = &healthy_family_->Add(labels);
  }
  return iter->second;
}

void
MetricsRegistry::set_queue_depth(std::string_view tier, std::size_t depth)
{
  const std::scoped_lock lock(mutex_);
  labelled_metric<prometheus::Gauge>(
      queue_depth_gauges_, queue_depth_family_, "tier", tier)
      ->Set(static_cast<double>(depth));
}

void
MetricsRegistry::increment_jobs_submitted(std::string_view kind)
{
  const std::scoped_lock lock(mutex_);
  labelled_metric<prometheus::Counter>(
      submitted_counters_, submitted_family_, "kind", kind)
      ->Increment();
}

void
MetricsRegistry::increment_jobs_finished(std::string_view outcome)
{
  const std::scoped_lock lock(mutex_);
  labelled_metric<prometheus::Counter>(
      finished_counters_, finished_family_, "outcome", outcome)
      ->Increment();
}

void
MetricsRegistry::observe_queue_wait(std::string_view tier, double seconds)
{
  const std::scoped_lock lock(mutex_);
  auto iter = queue_wait_histograms_.find(tier);
  if (iter == queue_wait_histograms_.end()) {
    auto* histogram = &queue_wait_family_->Add(
        {{"tier", std::string(tier)}}, kQueueWaitSecondsBuckets);
    iter = queue_wait_histograms_.emplace(std::string(tier), histogram).first;
  }
  iter->second->Observe(seconds);
}

void
MetricsRegistry::increment_device_errors(int device_id)
{
  const std::scoped_lock lock(mutex_);
  auto [iter, inserted] = device_error_counters_.try_emplace(device_id, nullptr);
  if (inserted) {
    iter->second =
        &device_errors_family_->Add({{"gpu", std::to_string(device_id)}});
  }
  iter->second->Increment();
}

void
MetricsRegistry::publish_device(const DeviceGaugeSample& sample)
{
  const std::scoped_lock lock(mutex_);
  auto& gauges = device_gauges_locked(sample.device_id);
  gauges.total->Set(sample.total_bytes);
  gauges.reserved->Set(sample.reserved_bytes);
  gauges.free->Set(sample.free_bytes);
  gauges.utilization->Set(sample.utilization_percent);
  gauges.temperature->Set(sample.temperature_celsius);
  gauges.healthy->Set(sample.healthy ? 1.0 : 0.0);
}

namespace {
auto
metrics_atomic() -> std::atomic<std::shared_ptr<MetricsRegistry>>&
{
  static std::atomic<std::shared_ptr<MetricsRegistry>> instance{nullptr};
  return instance;
}
}  // namespace

auto
init_metrics(int port) -> bool
{
  std::shared_ptr<MetricsRegistry> expected{nullptr};

  try {
    auto new_metrics = std::make_shared<MetricsRegistry>(port);
    if (!metrics_atomic().compare_exchange_strong(
            expected, new_metrics, std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      log_warning("Metrics were previously initialized");
      return false;
    }
    return true;
  }
  catch (const std::exception& e) {
    log_error(std::string("Metrics initialization failed: ") + e.what());
    return false;
  }
}

void
shutdown_metrics()
{
  metrics_atomic().store(nullptr, std::memory_order_release);
}

auto
get_metrics() -> std::shared_ptr<MetricsRegistry>
{
  return metrics_atomic().load(std::memory_order_acquire);
}

void
set_queue_depth(std::string_view tier, std::size_t depth)
{
  if (auto metrics = get_metrics()) {
    metrics->set_queue_depth(tier, depth);
  }
}

void
increment_jobs_submitted(std::string_view kind)
{
  if (auto metrics = get_metrics()) {
    metrics->increment_jobs_submitted(kind);
  }
}

void
increment_jobs_finished(std::string_view outcome)
{
  if (auto metrics = get_metrics()) {
    metrics->increment_jobs_finished(outcome);
  }
}

void
observe_queue_wait(std::string_view tier, double seconds)
{
  if (auto metrics = get_metrics()) {
    metrics->observe_queue_wait(tier, seconds);
  }
}

void
increment_evictions(std::size_t count)
{
  auto metrics = get_metrics();
  if (metrics && metrics->evictions_total != nullptr) {
    metrics->evictions_total->Increment(static_cast<double>(count));
  }
}

void
increment_failovers()
{
  auto metrics = get_metrics();
  if (metrics && metrics->failovers_total != nullptr) {
    metrics->failovers_total->Increment();
  }
}

void
increment_device_errors(int device_id)
{
  if (auto metrics = get_metrics()) {
    metrics->increment_device_errors(device_id);
  }
}

void
publish_device_gauges(const DeviceGaugeSample& sample)
{
  if (auto metrics = get_metrics()) {
    metrics->publish_device(sample);
  }
}

}  // namespace gpusched
