#include "scheduler_client.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "core/scheduling_types.hpp"
#include "utils/logger.hpp"

namespace gpusched {
namespace {

auto
mib(std::int64_t bytes) -> std::int64_t
{
  return bytes / static_cast<std::int64_t>(kBytesPerMiB);
}

auto
tier_name(rpc::PriorityTier tier) -> std::string
{
  switch (tier) {
    case rpc::PRIORITY_TIER_REALTIME:
      return "realtime";
    case rpc::PRIORITY_TIER_HIGH:
      return "high";
    case rpc::PRIORITY_TIER_NORMAL:
      return "normal";
    case rpc::PRIORITY_TIER_BATCH:
      return "batch";
    default:
      return "unspecified";
  }
}

auto
state_name(rpc::JobState state) -> std::string
{
  switch (state) {
    case rpc::JOB_STATE_QUEUED:
      return "queued";
    case rpc::JOB_STATE_ADMITTED:
      return "admitted";
    case rpc::JOB_STATE_RUNNING:
      return "running";
    case rpc::JOB_STATE_COMPLETED:
      return "completed";
    case rpc::JOB_STATE_FAILED:
      return "failed";
    case rpc::JOB_STATE_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

auto
kind_name(rpc::JobKind kind) -> std::string
{
  switch (kind) {
    case rpc::JOB_KIND_IMAGE:
      return "image";
    case rpc::JOB_KIND_VIDEO:
      return "video";
    case rpc::JOB_KIND_SPEECH:
      return "speech";
    default:
      return "unspecified";
  }
}
}  // namespace

// =============================================================================
// Formatting
// =============================================================================

auto
format_device_table(const rpc::ListDevicesResponse& response) -> std::string
{
  std::ostringstream out;
  out << std::left << std::setw(5) << "GPU" << std::setw(20) << "NAME"
      << std::right << std::setw(10) << "TOTAL" << std::setw(10) << "RESERVED"
      << std::setw(10) << "RESIDENT" << std::setw(10) << "FREE"
      << std::setw(7) << "UTIL%" << std::setw(7) << "TEMP" << std::setw(6)
      << "JOBS" << "  STATE\n";
  for (const auto& device : response.devices()) {
    out << std::left << std::setw(5) << device.id() << std::setw(20)
        << device.name() << std::right << std::setw(10)
        << mib(device.total_vram_bytes()) << std::setw(10)
        << mib(device.reserved_vram_bytes()) << std::setw(10)
        << mib(device.resident_vram_bytes()) << std::setw(10)
        << mib(device.free_vram_bytes()) << std::fixed << std::setprecision(1)
        << std::setw(7) << device.utilization_pct() << std::setw(7)
        << device.temperature_c() << std::setw(6)
        << device.active_reservations() << "  ";
    if (device.healthy()) {
      out << "healthy";
    } else {
      out << "quarantined (" << device.unhealthy_reason() << ")";
    }
    out << '\n';
  }
  out << "VRAM figures in MiB\n";
  return out.str();
}

auto
format_queue_table(const rpc::QueueDepthResponse& response) -> std::string
{
  std::ostringstream out;
  out << std::left << std::setw(10) << "TIER" << std::right << std::setw(8)
      << "QUEUED" << std::setw(8) << "ACTIVE" << '\n';
  for (const auto& tier : response.tiers()) {
    out << std::left << std::setw(10) << tier_name(tier.tier()) << std::right
        << std::setw(8) << tier.queued() << std::setw(8) << tier.active()
        << '\n';
  }
  return out.str();
}

auto
format_job_status(const rpc::JobStatusResponse& response) -> std::string
{
  std::ostringstream out;
  out << "job:      " << response.job_id() << '\n'
      << "state:    " << state_name(response.state()) << '\n'
      << "kind:     " << kind_name(response.kind()) << '\n'
      << "priority: " << tier_name(response.priority()) << '\n'
      << "vram:     " << mib(response.vram_estimate_bytes()) << " MiB\n";
  if (response.has_device()) {
    out << "gpu:      " << response.device_id() << '\n';
  }
  if (response.state() == rpc::JOB_STATE_QUEUED) {
    out << "waited:   " << response.waited_seconds() << " s\n"
        << "position: " << response.queue_position() << '\n';
  }
  if (!response.failure_reason().empty()) {
    out << "reason:   " << response.failure_reason() << '\n';
  }
  return out.str();
}

// =============================================================================
// SchedulerClient
// =============================================================================

SchedulerClient::SchedulerClient(
    const std::shared_ptr<grpc::Channel>& channel, VerbosityLevel verbosity)
    : stub_(rpc::GpuScheduler::NewStub(channel)), verbosity_(verbosity)
{
}

auto
SchedulerClient::check(const grpc::Status& status, const char* rpc_name) const
    -> bool
{
  if (!status.ok()) {
    log_error(
        std::string(rpc_name) + " failed: " + status.error_message() +
        " (code " + std::to_string(static_cast<int>(status.error_code())) +
        ")");
    return false;
  }
  log_trace(verbosity_, std::string(rpc_name) + " ok");
  return true;
}

auto
SchedulerClient::report_ack(const rpc::Ack& ack, const std::string& subject)
    const -> bool
{
  std::cout << subject << ": " << (ack.changed() ? "done" : "unchanged");
  if (!ack.message().empty()) {
    std::cout << " (" << ack.message() << ")";
  }
  std::cout << '\n';
  return true;
}

auto
SchedulerClient::ServerIsLive() -> bool
{
  const rpc::ServerLiveRequest request;
  rpc::ServerLiveResponse response;
  grpc::ClientContext context;

  const grpc::Status status = stub_->ServerLive(&context, request, &response);
  if (!check(status, "ServerLive")) {
    return false;
  }

  log_info(
      verbosity_,
      std::string("Server live: ") + (response.live() ? "true" : "false"));
  return response.live();
}

auto
SchedulerClient::ListDevices() -> bool
{
  const rpc::ListDevicesRequest request;
  rpc::ListDevicesResponse response;
  grpc::ClientContext context;
  if (!check(stub_->ListDevices(&context, request, &response), "ListDevices")) {
    return false;
  }
  std::cout << format_device_table(response);
  return true;
}

auto
SchedulerClient::QueueDepth() -> bool
{
  const rpc::QueueDepthRequest request;
  rpc::QueueDepthResponse response;
  grpc::ClientContext context;
  if (!check(
          stub_->GetQueueDepth(&context, request, &response),
          "GetQueueDepth")) {
    return false;
  }
  std::cout << format_queue_table(response);
  return true;
}

auto
SchedulerClient::JobStatus(const std::string& job_id) -> bool
{
  rpc::JobRequest request;
  request.set_job_id(job_id);
  rpc::JobStatusResponse response;
  grpc::ClientContext context;
  if (!check(
          stub_->GetJobStatus(&context, request, &response), "GetJobStatus")) {
    return false;
  }
  std::cout << format_job_status(response);
  return true;
}

auto
SchedulerClient::CancelJob(const std::string& job_id) -> bool
{
  rpc::JobRequest request;
  request.set_job_id(job_id);
  rpc::Ack ack;
  grpc::ClientContext context;
  if (!check(stub_->CancelJob(&context, request, &ack), "CancelJob")) {
    return false;
  }
  return report_ack(ack, "cancel " + job_id);
}

auto
SchedulerClient::ForceRelease(const std::string& job_id) -> bool
{
  rpc::JobRequest request;
  request.set_job_id(job_id);
  rpc::Ack ack;
  grpc::ClientContext context;
  if (!check(stub_->ForceRelease(&context, request, &ack), "ForceRelease")) {
    return false;
  }
  return report_ack(ack, "force-release " + job_id);
}

auto
SchedulerClient::QuarantineDevice(int device_id, const std::string& reason)
    -> bool
{
  rpc::DeviceRequest request;
  request.set_device_id(device_id);
  request.set_reason(reason);
  rpc::Ack ack;
  grpc::ClientContext context;
  if (!check(
          stub_->QuarantineDevice(&context, request, &ack),
          "QuarantineDevice")) {
    return false;
  }
  return report_ack(ack, "quarantine GPU " + std::to_string(device_id));
}

auto
SchedulerClient::RestoreDevice(int device_id) -> bool
{
  rpc::DeviceRequest request;
  request.set_device_id(device_id);
  rpc::Ack ack;
  grpc::ClientContext context;
  if (!check(stub_->RestoreDevice(&context, request, &ack), "RestoreDevice")) {
    return false;
  }
  return report_ack(ack, "restore GPU " + std::to_string(device_id));
}

auto
SchedulerClient::Run(const CtlConfig& cfg) -> bool
{
  switch (cfg.command) {
    case CtlCommand::Devices:
      return ListDevices();
    case CtlCommand::Queues:
      return QueueDepth();
    case CtlCommand::Status:
      return JobStatus(cfg.job_id);
    case CtlCommand::Cancel:
      return CancelJob(cfg.job_id);
    case CtlCommand::ForceRelease:
      return ForceRelease(cfg.job_id);
    case CtlCommand::Quarantine:
      return QuarantineDevice(cfg.device_id, cfg.reason);
    case CtlCommand::Restore:
      return RestoreDevice(cfg.device_id);
    case CtlCommand::None:
      break;
  }
  log_error("No command given");
  return false;
}
}  // namespace gpusched
