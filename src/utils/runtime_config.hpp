#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "logger.hpp"

namespace gpusched {
// =============================================================================
// Compile-time defaults
// =============================================================================
inline constexpr int kDefaultMetricsPort = 9090;
inline constexpr std::size_t kDefaultRealtimeQueueCapacity = 100;
inline constexpr std::size_t kDefaultHighQueueCapacity = 200;
inline constexpr std::size_t kDefaultNormalQueueCapacity = 500;
inline constexpr std::size_t kDefaultBatchQueueCapacity = 1000;

// =============================================================================
// ResidentModelConfig / DeviceConfig
// -----------------------------------------------------------------------------
// Static inventory entry and the models preloaded on it at startup.
// =============================================================================
struct ResidentModelConfig {
  std::string name;
  std::uint64_t vram_mib = 0;
  bool baseline = false;
};

struct DeviceConfig {
  int id = 0;
  std::string name;
  std::uint64_t total_vram_mib = 0;
  std::vector<int> nvlink_peers;
  std::vector<ResidentModelConfig> resident_models;
};

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Everything the server reads from its YAML file. `valid` is cleared by the
// loader on the first problem it logs.
// =============================================================================
struct RuntimeConfig {
  struct SchedulerSettings {
    std::size_t max_admission_attempts = 3;
    std::size_t drain_skip_limit = 8;
    std::int64_t queue_timeout_s = 600;
    std::int64_t timeout_sweep_ms = 1000;
    std::uint64_t memory_headroom_mib = 0;
    std::size_t finished_job_retention = 10000;
    std::size_t realtime_capacity = kDefaultRealtimeQueueCapacity;
    std::size_t high_capacity = kDefaultHighQueueCapacity;
    std::size_t normal_capacity = kDefaultNormalQueueCapacity;
    std::size_t batch_capacity = kDefaultBatchQueueCapacity;
  };

  struct HealthSettings {
    std::int64_t interval_ms = 15000;
    double temperature_limit_c = 85.0;
    std::size_t error_threshold = 10;
    std::int64_t error_window_s = 60;
    std::size_t recovery_sweeps = 3;
    double utilization_warning_pct = 95.0;
    double memory_warning_pct = 95.0;
  };

  struct TelemetrySettings {
    bool enabled = true;
    std::int64_t interval_ms = 15000;
  };

  struct RebalanceSettings {
    bool enabled = false;
    std::int64_t interval_s = 30;
    double deviation_ratio = 0.2;
    bool evict_idle_models = false;
  };

  struct EstimatorSettings {
    std::uint64_t image_mib = 12000;
    std::uint64_t video_mib = 16000;
    std::uint64_t speech_mib = 8000;
  };

  std::string name;
  std::string config_path;
  std::string server_address = "127.0.0.1:50051";
  int metrics_port = kDefaultMetricsPort;
  bool discover_devices = false;

  std::vector<DeviceConfig> devices;
  VerbosityLevel verbosity = VerbosityLevel::Silent;
  SchedulerSettings scheduler{};
  HealthSettings health{};
  TelemetrySettings telemetry{};
  RebalanceSettings rebalance{};
  EstimatorSettings estimator{};
  bool show_help = false;
  bool valid = true;
};

}  // namespace gpusched
