#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace prometheus {
class Exposer;
class Collectable;
template <typename T>
class Family;
}  // namespace prometheus

namespace gpusched {

// Per-device gauge values published together by the scheduler's device table.
struct DeviceGaugeSample {
  int device_id{0};
  double total_bytes{0.0};
  double reserved_bytes{0.0};
  double free_bytes{0.0};
  double utilization_percent{0.0};
  double temperature_celsius{0.0};
  bool healthy{true};
};

class MetricsRegistry {
 public:
  struct ExposerHandle {
    ExposerHandle() = default;
    ExposerHandle(const ExposerHandle&) = delete;
    auto operator=(const ExposerHandle&) -> ExposerHandle& = delete;
    ExposerHandle(ExposerHandle&&) = delete;
    auto operator=(ExposerHandle&&) -> ExposerHandle& = delete;
    virtual ~ExposerHandle() = default;
    virtual void RegisterCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
    virtual void RemoveCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
  };

  explicit MetricsRegistry(
      int port, std::unique_ptr<ExposerHandle> exposer_handle = nullptr);
  ~MetricsRegistry() noexcept;
  MetricsRegistry(const MetricsRegistry&) = delete;
  auto operator=(const MetricsRegistry&) -> MetricsRegistry& = delete;
  MetricsRegistry(MetricsRegistry&&) = delete;
  auto operator=(MetricsRegistry&&) -> MetricsRegistry& = delete;

  std::shared_ptr<prometheus::Registry>
      registry;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter*
      evictions_total;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter*
      failovers_total;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)

  void set_queue_depth(std::string_view tier, std::size_t depth);
  void increment_jobs_submitted(std::string_view kind);
  void increment_jobs_finished(std::string_view outcome);
  void observe_queue_wait(std::string_view tier, double seconds);
  void increment_device_errors(int device_id);
  void publish_device(const DeviceGaugeSample& sample);

 private:
  struct DeviceGauges {
    prometheus::Gauge* total{nullptr};
    prometheus::Gauge* reserved{nullptr};
    prometheus::Gauge* free{nullptr};
    prometheus::Gauge* utilization{nullptr};
    prometheus::Gauge* temperature{nullptr};
    prometheus::Gauge* healthy{nullptr};
  };

  void initialize(int port, std::unique_ptr<ExposerHandle> exposer_handle);
  auto device_gauges_locked(int device_id) -> DeviceGauges&;

  std::unique_ptr<ExposerHandle> exposer_;

  prometheus::Family<prometheus::Gauge>* vram_total_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* vram_reserved_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* vram_free_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* utilization_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* temperature_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* healthy_family_{nullptr};
  prometheus::Family<prometheus::Gauge>* queue_depth_family_{nullptr};
  prometheus::Family<prometheus::Counter>* submitted_family_{nullptr};
  prometheus::Family<prometheus::Counter>* finished_family_{nullptr};
  prometheus::Family<prometheus::Histogram>* queue_wait_family_{nullptr};
  prometheus::Family<prometheus::Counter>* device_errors_family_{nullptr};

  std::mutex mutex_;
  std::map<int, DeviceGauges> device_gauges_;
  std::map<std::string, prometheus::Gauge*, std::less<>> queue_depth_gauges_;
  std::map<std::string, prometheus::Counter*, std::less<>> submitted_counters_;
  std::map<std::string, prometheus::Counter*, std::less<>> finished_counters_;
  std::map<std::string, prometheus::Histogram*, std::less<>>
      queue_wait_histograms_;
  std::map<int, prometheus::Counter*> device_error_counters_;
};

auto init_metrics(int port) -> bool;
void shutdown_metrics();
auto get_metrics() -> std::shared_ptr<MetricsRegistry>;

// Process-wide helpers; no-ops until init_metrics succeeded.
void set_queue_depth(std::string_view tier, std::size_t depth);
void increment_jobs_submitted(std::string_view kind);
void increment_jobs_finished(std::string_view outcome);
void observe_queue_wait(std::string_view tier, double seconds);
void increment_evictions(std::size_t count);
void increment_failovers();
void increment_device_errors(int device_id);
void publish_device_gauges(const DeviceGaugeSample& sample);

}  // namespace gpusched
