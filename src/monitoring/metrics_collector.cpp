#include "monitoring/metrics_collector.hpp"

#include <array>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#ifdef GPUSCHED_HAVE_NVML
#include <nvml.h>
#endif

namespace gpusched {

namespace {

#ifdef GPUSCHED_HAVE_NVML

class NvmlWrapper {
 public:
  static auto instance() -> NvmlWrapper&;

  auto query_samples() -> std::vector<DeviceSample>;
  auto discover() -> std::vector<Device>;

  NvmlWrapper(const NvmlWrapper&) = delete;
  auto operator=(const NvmlWrapper&) -> NvmlWrapper& = delete;
  NvmlWrapper(NvmlWrapper&&) = delete;
  auto operator=(NvmlWrapper&&) -> NvmlWrapper& = delete;

 private:
  NvmlWrapper();
  ~NvmlWrapper();

  static auto error_string(nvmlReturn_t status) -> std::string;
  auto device_count_locked() -> unsigned int;
  auto nvlink_peers_locked(nvmlDevice_t device) -> std::set<DeviceId>;

  bool initialized_{false};
  std::mutex mutex_{};
};

auto
NvmlWrapper::instance() -> NvmlWrapper&
{
  static NvmlWrapper wrapper;
  return wrapper;
}

NvmlWrapper::NvmlWrapper()
{
  const nvmlReturn_t status = nvmlInit();
  if (status != NVML_SUCCESS) {
    log_warning("Failed to initialize NVML: " + error_string(status));
    return;
  }
  initialized_ = true;
}

NvmlWrapper::~NvmlWrapper()
{
  if (initialized_) {
    nvmlShutdown();
  }
}

auto
NvmlWrapper::error_string(nvmlReturn_t status) -> std::string
{
  const char* err = nvmlErrorString(status);
  return err != nullptr ? err : "unknown error";
}

auto
NvmlWrapper::device_count_locked() -> unsigned int
{
  unsigned int device_count = 0;
  const nvmlReturn_t status = nvmlDeviceGetCount(&device_count);
  if (status != NVML_SUCCESS) {
    log_warning("nvmlDeviceGetCount failed: " + error_string(status));
    return 0;
  }
  return device_count;
}

auto
NvmlWrapper::query_samples() -> std::vector<DeviceSample>
{
  const std::scoped_lock guard(mutex_);
  if (!initialized_) {
    return {};
  }

  const unsigned int device_count = device_count_locked();
  std::vector<DeviceSample> samples;
  samples.reserve(device_count);

  for (unsigned int idx = 0; idx < device_count; ++idx) {
    const std::string label = "GPU " + std::to_string(idx);
    nvmlDevice_t device{};
    nvmlReturn_t status = nvmlDeviceGetHandleByIndex(idx, &device);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetHandleByIndex failed for " + label + ": " +
          error_string(status));
      continue;
    }

    nvmlUtilization_t utilization{};
    status = nvmlDeviceGetUtilizationRates(device, &utilization);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetUtilizationRates failed for " + label + ": " +
          error_string(status));
      continue;
    }

    unsigned int temperature = 0;
    status = nvmlDeviceGetTemperature(device, NVML_TEMPERATURE_GPU, &temperature);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetTemperature failed for " + label + ": " +
          error_string(status));
      continue;
    }

    nvmlMemory_t memory_info{};
    status = nvmlDeviceGetMemoryInfo(device, &memory_info);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetMemoryInfo failed for " + label + ": " +
          error_string(status));
      continue;
    }

    DeviceSample sample;
    sample.device_id = static_cast<DeviceId>(idx);
    sample.utilization_pct = static_cast<double>(utilization.gpu);
    sample.temperature_c = static_cast<double>(temperature);
    sample.used_vram = static_cast<Bytes>(memory_info.used);
    samples.push_back(sample);
  }
  return samples;
}

auto
NvmlWrapper::nvlink_peers_locked(nvmlDevice_t device) -> std::set<DeviceId>
{
  std::set<DeviceId> peers;
  for (unsigned int link = 0; link < NVML_NVLINK_MAX_LINKS; ++link) {
    nvmlEnableState_t active = NVML_FEATURE_DISABLED;
    if (nvmlDeviceGetNvLinkState(device, link, &active) != NVML_SUCCESS ||
        active != NVML_FEATURE_ENABLED) {
      continue;
    }
    nvmlPciInfo_t pci{};
    if (nvmlDeviceGetNvLinkRemotePciInfo(device, link, &pci) != NVML_SUCCESS) {
      continue;
    }
    nvmlDevice_t peer{};
    unsigned int peer_index = 0;
    if (nvmlDeviceGetHandleByPciBusId(pci.busId, &peer) == NVML_SUCCESS &&
        nvmlDeviceGetIndex(peer, &peer_index) == NVML_SUCCESS) {
      peers.insert(static_cast<DeviceId>(peer_index));
    }
  }
  return peers;
}

auto
NvmlWrapper::discover() -> std::vector<Device>
{
  const std::scoped_lock guard(mutex_);
  if (!initialized_) {
    return {};
  }

  const unsigned int device_count = device_count_locked();
  std::vector<Device> devices;
  devices.reserve(device_count);
  for (unsigned int idx = 0; idx < device_count; ++idx) {
    nvmlDevice_t handle{};
    nvmlReturn_t status = nvmlDeviceGetHandleByIndex(idx, &handle);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetHandleByIndex failed for GPU " + std::to_string(idx) +
          ": " + error_string(status));
      continue;
    }
    nvmlMemory_t memory_info{};
    status = nvmlDeviceGetMemoryInfo(handle, &memory_info);
    if (status != NVML_SUCCESS) {
      log_warning(
          "nvmlDeviceGetMemoryInfo failed for GPU " + std::to_string(idx) +
          ": " + error_string(status));
      continue;
    }
    std::array<char, NVML_DEVICE_NAME_BUFFER_SIZE> name{};
    if (nvmlDeviceGetName(handle, name.data(), name.size()) != NVML_SUCCESS) {
      name[0] = '\0';
    }

    Device device;
    device.id = static_cast<DeviceId>(idx);
    device.name = name.data();
    device.total_vram = static_cast<Bytes>(memory_info.total);
    device.external_used_vram = static_cast<Bytes>(memory_info.used);
    device.nvlink_peers = nvlink_peers_locked(handle);
    devices.push_back(std::move(device));
  }
  return devices;
}

#else

auto
nvml_warning_flag() -> std::once_flag&
{
  static std::once_flag flag;
  return flag;
}

void
warn_nvml_unavailable()
{
  std::call_once(nvml_warning_flag(), [] {
    log_warning_critical(
        "NVML support is not available; GPU telemetry collection is "
        "disabled.");
  });
}

#endif  // GPUSCHED_HAVE_NVML

}  // namespace

auto
query_nvml_samples() -> std::vector<DeviceSample>
{
#ifdef GPUSCHED_HAVE_NVML
  return NvmlWrapper::instance().query_samples();
#else
  warn_nvml_unavailable();
  return {};
#endif
}

auto
discover_nvml_devices() -> std::vector<Device>
{
#ifdef GPUSCHED_HAVE_NVML
  return NvmlWrapper::instance().discover();
#else
  warn_nvml_unavailable();
  return {};
#endif
}

MetricsCollector::MetricsCollector(
    DeviceRegistry& registry, DeviceSampleProvider provider,
    std::chrono::milliseconds interval, VerbosityLevel verbosity)
    : registry_(&registry), provider_(std::move(provider)),
      interval_(interval), verbosity_(verbosity)
{
  if (!provider_) {
    provider_ = query_nvml_samples;
  }
}

MetricsCollector::~MetricsCollector()
{
  stop();
}

auto
MetricsCollector::collect_once() -> std::size_t
{
  std::size_t accepted = 0;
  for (const auto& sample : provider_()) {
    if (registry_->ingest_metrics(
            sample.device_id, sample.utilization_pct, sample.temperature_c,
            sample.used_vram)) {
      ++accepted;
    }
  }
  log_trace(
      verbosity_,
      "Telemetry pass updated " + std::to_string(accepted) + " device(s)");
  return accepted;
}

void
MetricsCollector::start()
{
  if (!task_) {
    task_ = std::make_unique<PeriodicTask>(
        "metrics collector", interval_, [this] { collect_once(); },
        verbosity_);
  }
  task_->start();
}

void
MetricsCollector::stop()
{
  if (task_) {
    task_->stop();
  }
}

}  // namespace gpusched
