#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "transparent_hash.hpp"

namespace gpusched {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

using KeySet = std::unordered_set<std::string, TransparentHash, std::equal_to<>>;

auto
post_parse_hook_mutex() -> std::mutex&
{
  static std::mutex mutex;
  return mutex;
}

auto
post_parse_hook() -> ConfigLoaderPostParseHook&
{
  static ConfigLoaderPostParseHook hook;
  return hook;
}

auto
validate_allowed_keys(
    const YAML::Node& node, const KeySet& allowed, std::string_view section,
    RuntimeConfig& cfg) -> bool
{
  bool clean = true;
  for (const auto& kvalue : node) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      clean = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!allowed.contains(key)) {
      log_error(
          std::string("Unknown configuration option: ") +
          (section.empty() ? key : std::string(section) + "." + key));
      cfg.valid = false;
      clean = false;
    }
  }
  return clean;
}

auto
section_node(
    const YAML::Node& root, const std::string& name, const KeySet& allowed,
    RuntimeConfig& cfg) -> YAML::Node
{
  YAML::Node node = root[name];
  if (!node) {
    return node;
  }
  if (!node.IsMap()) {
    throw std::invalid_argument(name + " must be a mapping");
  }
  validate_allowed_keys(node, allowed, name, cfg);
  return node;
}

template <typename T>
auto
non_negative(const YAML::Node& node, const std::string& key) -> T
{
  const auto value = node[key].as<long long>();
  if (value < 0) {
    throw std::invalid_argument(key + " must be >= 0");
  }
  return static_cast<T>(value);
}

template <typename T>
auto
positive(const YAML::Node& node, const std::string& key) -> T
{
  const auto value = node[key].as<long long>();
  if (value <= 0) {
    throw std::invalid_argument(key + " must be > 0");
  }
  return static_cast<T>(value);
}

auto
percentage(const YAML::Node& node, const std::string& key) -> double
{
  const auto value = node[key].as<double>();
  if (value < 0.0 || value > 100.0) {
    throw std::invalid_argument(key + " must be between 0 and 100");
  }
  return value;
}

void
parse_verbosity(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  } else if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  }
}

auto
validate_required_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  const bool discover =
      root["discover_devices"] && root["discover_devices"].as<bool>();
  if (!discover && !root["devices"]) {
    log_error("Missing required key: devices");
    cfg.valid = false;
  }
  return cfg.valid;
}

void
parse_general_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["name"]) {
    cfg.name = root["name"].as<std::string>();
  }
  if (root["address"]) {
    cfg.server_address = root["address"].as<std::string>();
    if (cfg.server_address.empty()) {
      log_error("address must not be empty");
      cfg.valid = false;
    }
  }
  if (root["metrics_port"]) {
    cfg.metrics_port = root["metrics_port"].as<int>();
    if (cfg.metrics_port < kMinPort || cfg.metrics_port > kMaxPort) {
      log_error("metrics_port must be between 1 and 65535");
      cfg.valid = false;
    }
  }
  if (root["discover_devices"]) {
    cfg.discover_devices = root["discover_devices"].as<bool>();
  }
}

auto
parse_resident_models(const YAML::Node& nodes, int device_id)
    -> std::vector<ResidentModelConfig>
{
  static const KeySet kAllowed{"name", "vram_mib", "baseline"};
  std::vector<ResidentModelConfig> models;
  if (!nodes.IsSequence()) {
    throw std::invalid_argument(
        "devices[" + std::to_string(device_id) +
        "].resident_models must be a sequence");
  }
  for (const auto& node : nodes) {
    if (!node.IsMap() || !node["name"] || !node["vram_mib"]) {
      throw std::invalid_argument(
          "resident model entries require name and vram_mib");
    }
    for (const auto& kvalue : node) {
      if (!kAllowed.contains(kvalue.first.as<std::string>())) {
        throw std::invalid_argument(
            "Unknown resident model option: " +
            kvalue.first.as<std::string>());
      }
    }
    ResidentModelConfig model;
    model.name = node["name"].as<std::string>();
    model.vram_mib = positive<std::uint64_t>(node, "vram_mib");
    if (node["baseline"]) {
      model.baseline = node["baseline"].as<bool>();
    }
    models.push_back(std::move(model));
  }
  return models;
}

void
parse_device_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{
      "id", "name", "total_vram_mib", "nvlink_peers", "resident_models"};

  const YAML::Node devices = root["devices"];
  if (!devices) {
    return;
  }
  if (!devices.IsSequence()) {
    log_error("devices must be a sequence of device mappings");
    cfg.valid = false;
    return;
  }

  std::set<int> seen;
  for (const auto& node : devices) {
    if (!node.IsMap()) {
      log_error("devices entries must be mappings");
      cfg.valid = false;
      continue;
    }
    validate_allowed_keys(node, kAllowed, "devices[]", cfg);
    if (!node["id"] || !node["total_vram_mib"]) {
      log_error("devices entries require id and total_vram_mib");
      cfg.valid = false;
      continue;
    }

    DeviceConfig device;
    device.id = node["id"].as<int>();
    if (device.id < 0) {
      throw std::invalid_argument("device id must be >= 0");
    }
    if (!seen.insert(device.id).second) {
      log_error("Duplicate device id: " + std::to_string(device.id));
      cfg.valid = false;
      continue;
    }
    device.name = node["name"] ? node["name"].as<std::string>()
                               : "GPU " + std::to_string(device.id);
    device.total_vram_mib = positive<std::uint64_t>(node, "total_vram_mib");
    if (node["nvlink_peers"]) {
      device.nvlink_peers = node["nvlink_peers"].as<std::vector<int>>();
    }
    if (node["resident_models"]) {
      device.resident_models =
          parse_resident_models(node["resident_models"], device.id);
    }
    cfg.devices.push_back(std::move(device));
  }

  if (cfg.devices.empty() && !cfg.discover_devices) {
    log_error("devices must list at least one device");
    cfg.valid = false;
  }
}

void
parse_scheduler_node(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{
      "max_admission_attempts", "drain_skip_limit",   "queue_timeout_s",
      "timeout_sweep_ms",       "memory_headroom_mib", "queue_capacity",
      "finished_job_retention"};
  static const KeySet kTiers{"realtime", "high", "normal", "batch"};

  const YAML::Node node = section_node(root, "scheduler", kAllowed, cfg);
  if (!node) {
    return;
  }
  auto& settings = cfg.scheduler;
  if (node["max_admission_attempts"]) {
    settings.max_admission_attempts =
        positive<std::size_t>(node, "max_admission_attempts");
  }
  if (node["drain_skip_limit"]) {
    settings.drain_skip_limit = positive<std::size_t>(node, "drain_skip_limit");
  }
  if (node["queue_timeout_s"]) {
    settings.queue_timeout_s = non_negative<std::int64_t>(node, "queue_timeout_s");
  }
  if (node["timeout_sweep_ms"]) {
    settings.timeout_sweep_ms = positive<std::int64_t>(node, "timeout_sweep_ms");
  }
  if (node["memory_headroom_mib"]) {
    settings.memory_headroom_mib =
        non_negative<std::uint64_t>(node, "memory_headroom_mib");
  }
  if (node["finished_job_retention"]) {
    settings.finished_job_retention =
        non_negative<std::size_t>(node, "finished_job_retention");
  }

  const YAML::Node capacity = node["queue_capacity"];
  if (!capacity) {
    return;
  }
  if (!capacity.IsMap()) {
    throw std::invalid_argument("scheduler.queue_capacity must be a mapping");
  }
  validate_allowed_keys(capacity, kTiers, "scheduler.queue_capacity", cfg);
  if (capacity["realtime"]) {
    settings.realtime_capacity = non_negative<std::size_t>(capacity, "realtime");
  }
  if (capacity["high"]) {
    settings.high_capacity = non_negative<std::size_t>(capacity, "high");
  }
  if (capacity["normal"]) {
    settings.normal_capacity = non_negative<std::size_t>(capacity, "normal");
  }
  if (capacity["batch"]) {
    settings.batch_capacity = non_negative<std::size_t>(capacity, "batch");
  }
}

void
parse_health_node(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{
      "interval_ms",     "temperature_limit_c",      "error_threshold",
      "error_window_s",  "recovery_sweeps",          "utilization_warning_pct",
      "memory_warning_pct"};

  const YAML::Node node = section_node(root, "health", kAllowed, cfg);
  if (!node) {
    return;
  }
  auto& settings = cfg.health;
  if (node["interval_ms"]) {
    settings.interval_ms = positive<std::int64_t>(node, "interval_ms");
  }
  if (node["temperature_limit_c"]) {
    settings.temperature_limit_c = node["temperature_limit_c"].as<double>();
    if (settings.temperature_limit_c <= 0.0) {
      throw std::invalid_argument("temperature_limit_c must be > 0");
    }
  }
  if (node["error_threshold"]) {
    settings.error_threshold = non_negative<std::size_t>(node, "error_threshold");
  }
  if (node["error_window_s"]) {
    settings.error_window_s = positive<std::int64_t>(node, "error_window_s");
  }
  if (node["recovery_sweeps"]) {
    settings.recovery_sweeps = positive<std::size_t>(node, "recovery_sweeps");
  }
  if (node["utilization_warning_pct"]) {
    settings.utilization_warning_pct =
        percentage(node, "utilization_warning_pct");
  }
  if (node["memory_warning_pct"]) {
    settings.memory_warning_pct = percentage(node, "memory_warning_pct");
  }
}

void
parse_telemetry_node(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{"enabled", "interval_ms"};
  const YAML::Node node = section_node(root, "telemetry", kAllowed, cfg);
  if (!node) {
    return;
  }
  if (node["enabled"]) {
    cfg.telemetry.enabled = node["enabled"].as<bool>();
  }
  if (node["interval_ms"]) {
    cfg.telemetry.interval_ms = positive<std::int64_t>(node, "interval_ms");
  }
}

void
parse_rebalance_node(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{
      "enabled", "interval_s", "deviation_ratio", "evict_idle_models"};
  const YAML::Node node = section_node(root, "rebalance", kAllowed, cfg);
  if (!node) {
    return;
  }
  auto& settings = cfg.rebalance;
  if (node["enabled"]) {
    settings.enabled = node["enabled"].as<bool>();
  }
  if (node["interval_s"]) {
    settings.interval_s = positive<std::int64_t>(node, "interval_s");
  }
  if (node["deviation_ratio"]) {
    settings.deviation_ratio = node["deviation_ratio"].as<double>();
    if (settings.deviation_ratio < 0.0) {
      throw std::invalid_argument("deviation_ratio must be >= 0");
    }
  }
  if (node["evict_idle_models"]) {
    settings.evict_idle_models = node["evict_idle_models"].as<bool>();
  }
}

void
parse_estimator_node(const YAML::Node& root, RuntimeConfig& cfg)
{
  static const KeySet kAllowed{"image_mib", "video_mib", "speech_mib"};
  const YAML::Node node = section_node(root, "estimator", kAllowed, cfg);
  if (!node) {
    return;
  }
  if (node["image_mib"]) {
    cfg.estimator.image_mib = positive<std::uint64_t>(node, "image_mib");
  }
  if (node["video_mib"]) {
    cfg.estimator.video_mib = positive<std::uint64_t>(node, "video_mib");
  }
  if (node["speech_mib"]) {
    cfg.estimator.speech_mib = positive<std::uint64_t>(node, "speech_mib");
  }
}

}  // namespace

void
set_config_loader_post_parse_hook(ConfigLoaderPostParseHook hook)
{
  const std::scoped_lock lock(post_parse_hook_mutex());
  post_parse_hook() = std::move(hook);
}

void
reset_config_loader_post_parse_hook()
{
  set_config_loader_post_parse_hook(nullptr);
}

auto
load_config(const std::string& path) -> RuntimeConfig
{
  static const KeySet kAllowedKeys{
      "name",      "verbose",   "verbosity", "address",
      "metrics_port", "discover_devices", "devices", "scheduler",
      "health",    "telemetry", "rebalance", "estimator"};

  RuntimeConfig cfg;
  cfg.config_path = path;
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root || !root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    parse_verbosity(root, cfg);
    if (!validate_allowed_keys(root, kAllowedKeys, {}, cfg)) {
      return cfg;
    }
    if (!validate_required_keys(root, cfg)) {
      return cfg;
    }
    parse_general_nodes(root, cfg);
    parse_device_nodes(root, cfg);
    parse_scheduler_node(root, cfg);
    parse_health_node(root, cfg);
    parse_telemetry_node(root, cfg);
    parse_rebalance_node(root, cfg);
    parse_estimator_node(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }

  ConfigLoaderPostParseHook hook;
  {
    const std::scoped_lock lock(post_parse_hook_mutex());
    hook = post_parse_hook();
  }
  if (hook) {
    hook(cfg);
  }
  return cfg;
}

}  // namespace gpusched
