#include "scheduler_service.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "utils/exceptions.hpp"

namespace gpusched {
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

// =============================================================================
// Wire conversions
// =============================================================================

auto
to_priority_tier(rpc::PriorityTier tier) -> PriorityTier
{
  switch (tier) {
    case rpc::PRIORITY_TIER_REALTIME:
      return PriorityTier::Realtime;
    case rpc::PRIORITY_TIER_HIGH:
      return PriorityTier::High;
    case rpc::PRIORITY_TIER_BATCH:
      return PriorityTier::Batch;
    default:
      return PriorityTier::Normal;
  }
}

auto
to_proto(PriorityTier tier) -> rpc::PriorityTier
{
  switch (tier) {
    case PriorityTier::Realtime:
      return rpc::PRIORITY_TIER_REALTIME;
    case PriorityTier::High:
      return rpc::PRIORITY_TIER_HIGH;
    case PriorityTier::Normal:
      return rpc::PRIORITY_TIER_NORMAL;
    case PriorityTier::Batch:
      return rpc::PRIORITY_TIER_BATCH;
  }
  return rpc::PRIORITY_TIER_UNSPECIFIED;
}

auto
to_proto(JobState state) -> rpc::JobState
{
  switch (state) {
    case JobState::Queued:
      return rpc::JOB_STATE_QUEUED;
    case JobState::Admitted:
      return rpc::JOB_STATE_ADMITTED;
    case JobState::Running:
      return rpc::JOB_STATE_RUNNING;
    case JobState::Completed:
      return rpc::JOB_STATE_COMPLETED;
    case JobState::Failed:
      return rpc::JOB_STATE_FAILED;
    case JobState::Cancelled:
      return rpc::JOB_STATE_CANCELLED;
  }
  return rpc::JOB_STATE_UNSPECIFIED;
}

auto
to_proto(JobKind kind) -> rpc::JobKind
{
  switch (kind) {
    case JobKind::Image:
      return rpc::JOB_KIND_IMAGE;
    case JobKind::Video:
      return rpc::JOB_KIND_VIDEO;
    case JobKind::Speech:
      return rpc::JOB_KIND_SPEECH;
  }
  return rpc::JOB_KIND_UNSPECIFIED;
}

namespace {
auto
payload_from_request(const rpc::SubmitJobRequest& request) -> JobPayload
{
  switch (request.payload_case()) {
    case rpc::SubmitJobRequest::kImage: {
      const auto& image = request.image();
      ImagePayload payload;
      payload.model = image.model();
      payload.prompt = image.prompt();
      if (image.width() > 0) {
        payload.width = image.width();
      }
      if (image.height() > 0) {
        payload.height = image.height();
      }
      if (image.steps() > 0) {
        payload.steps = image.steps();
      }
      if (image.batch_size() > 0) {
        payload.batch_size = image.batch_size();
      }
      return payload;
    }
    case rpc::SubmitJobRequest::kVideo: {
      const auto& video = request.video();
      VideoPayload payload;
      payload.model = video.model();
      if (video.width() > 0) {
        payload.width = video.width();
      }
      if (video.height() > 0) {
        payload.height = video.height();
      }
      if (video.frames() > 0) {
        payload.frames = video.frames();
      }
      if (video.fps() > 0) {
        payload.fps = video.fps();
      }
      return payload;
    }
    case rpc::SubmitJobRequest::kSpeech: {
      const auto& speech = request.speech();
      return SpeechPayload{speech.model(), speech.voice(), speech.text()};
    }
    default:
      break;
  }
  throw InvalidJobException("Job payload is missing or of an unknown kind");
}

auto
require_non_negative(std::int64_t value, std::string_view field) -> Bytes
{
  if (value < 0) {
    throw InvalidJobException(
        std::string(field) + " must not be negative, got " +
        std::to_string(value));
  }
  return static_cast<Bytes>(value);
}

auto
as_int64(Bytes value) -> std::int64_t
{
  return static_cast<std::int64_t>(value);
}

// Maps the exception taxonomy onto gRPC status codes. Capacity problems are
// RESOURCE_EXHAUSTED; anything unexpected is INTERNAL and logged.
template <typename Callback>
auto
handle_call(
    std::string_view method, VerbosityLevel verbosity,
    Callback&& callback) -> Status
{
  log_trace(verbosity, "gRPC " + std::string(method));
  try {
    std::forward<Callback>(callback)();
    return Status::OK;
  }
  catch (const InvalidJobException& e) {
    return {StatusCode::INVALID_ARGUMENT, e.what()};
  }
  catch (const UnknownJobException& e) {
    return {StatusCode::NOT_FOUND, e.what()};
  }
  catch (const UnknownDeviceException& e) {
    return {StatusCode::NOT_FOUND, e.what()};
  }
  catch (const InvalidJobTransitionException& e) {
    return {StatusCode::FAILED_PRECONDITION, e.what()};
  }
  catch (const DeviceUnhealthyException& e) {
    return {StatusCode::FAILED_PRECONDITION, e.what()};
  }
  catch (const InsufficientCapacityException& e) {
    return {StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  catch (const QueueFullException& e) {
    return {StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  catch (const GpuSchedulerException& e) {
    log_error(std::string(method) + " failed: " + e.what());
    return {StatusCode::INTERNAL, e.what()};
  }
  catch (const std::invalid_argument& e) {
    return {StatusCode::INVALID_ARGUMENT, e.what()};
  }
  catch (const std::exception& e) {
    log_error(std::string(method) + " failed: " + e.what());
    return {StatusCode::INTERNAL, e.what()};
  }
}
}  // namespace

auto
job_from_request(const rpc::SubmitJobRequest& request) -> Job
{
  auto payload = payload_from_request(request);
  const Bytes estimate = require_non_negative(
      request.vram_estimate_bytes(), "vram_estimate_bytes");
  return make_job(
      request.job_id(), std::move(payload),
      to_priority_tier(request.priority()), estimate);
}

// =============================================================================
// SchedulerServiceImpl
// =============================================================================

SchedulerServiceImpl::SchedulerServiceImpl(
    SchedulerRuntime& runtime, VerbosityLevel verbosity)
    : runtime_(&runtime), verbosity_(verbosity)
{
}

auto
SchedulerServiceImpl::ServerLive(
    ServerContext* /*context*/, const rpc::ServerLiveRequest* /*request*/,
    rpc::ServerLiveResponse* reply) -> Status
{
  reply->set_live(true);
  return Status::OK;
}

auto
SchedulerServiceImpl::SubmitJob(
    ServerContext* /*context*/, const rpc::SubmitJobRequest* request,
    rpc::SubmitJobResponse* reply) -> Status
{
  return handle_call("SubmitJob", verbosity_, [&] {
    auto& scheduler = runtime_->scheduler();
    const auto job_id = scheduler.submit(job_from_request(*request));
    reply->set_job_id(job_id);
    if (const auto job = scheduler.describe(job_id)) {
      reply->set_state(to_proto(job->state));
      if (job->device_id) {
        reply->set_device_id(*job->device_id);
      }
      reply->set_failure_reason(job->failure_reason);
    }
  });
}

auto
SchedulerServiceImpl::CancelJob(
    ServerContext* /*context*/, const rpc::JobRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("CancelJob", verbosity_, [&] {
    const bool changed = runtime_->scheduler().cancel(request->job_id());
    reply->set_changed(changed);
    reply->set_message(changed ? "cancelled" : "job already finished");
  });
}

auto
SchedulerServiceImpl::GetJobStatus(
    ServerContext* /*context*/, const rpc::JobRequest* request,
    rpc::JobStatusResponse* reply) -> Status
{
  return handle_call("GetJobStatus", verbosity_, [&] {
    auto& scheduler = runtime_->scheduler();
    const auto job = scheduler.describe(request->job_id());
    if (!job) {
      throw UnknownJobException("Unknown job " + request->job_id());
    }
    reply->set_job_id(job->id);
    reply->set_state(to_proto(job->state));
    reply->set_kind(to_proto(job->kind()));
    reply->set_priority(to_proto(job->priority_tier));
    reply->set_vram_estimate_bytes(as_int64(job->vram_estimate));
    reply->set_has_device(job->device_id.has_value());
    if (job->device_id) {
      reply->set_device_id(*job->device_id);
    }
    reply->set_failure_reason(job->failure_reason);
    if (const auto wait = scheduler.estimate_wait(job->id)) {
      reply->set_waited_seconds(wait->waited.count());
      reply->set_queue_position(static_cast<std::int64_t>(wait->position));
    }
  });
}

auto
SchedulerServiceImpl::StartJob(
    ServerContext* /*context*/, const rpc::JobRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("StartJob", verbosity_, [&] {
    runtime_->scheduler().start(request->job_id());
    reply->set_changed(true);
    reply->set_message("running");
  });
}

auto
SchedulerServiceImpl::CompleteJob(
    ServerContext* /*context*/, const rpc::CompleteJobRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("CompleteJob", verbosity_, [&] {
    std::optional<DeviceId> device_id;
    if (request->has_device()) {
      device_id = request->device_id();
    }
    const bool changed = runtime_->scheduler().complete(
        request->job_id(), request->success(), request->reason(), device_id);
    reply->set_changed(changed);
    if (!changed) {
      reply->set_message("report ignored");
    }
  });
}

auto
SchedulerServiceImpl::ListDevices(
    ServerContext* /*context*/, const rpc::ListDevicesRequest* /*request*/,
    rpc::ListDevicesResponse* reply) -> Status
{
  return handle_call("ListDevices", verbosity_, [&] {
    for (const auto& row : runtime_->scheduler().device_table()) {
      auto* device = reply->add_devices();
      device->set_id(row.id);
      device->set_name(row.name);
      device->set_total_vram_bytes(as_int64(row.total_vram));
      device->set_reserved_vram_bytes(as_int64(row.reserved_vram));
      device->set_resident_vram_bytes(as_int64(row.resident_vram));
      device->set_used_vram_bytes(as_int64(row.used_vram));
      device->set_free_vram_bytes(as_int64(row.free_vram));
      device->set_utilization_pct(row.utilization_pct);
      device->set_temperature_c(row.temperature_c);
      device->set_healthy(row.healthy);
      device->set_unhealthy_reason(row.unhealthy_reason);
      device->set_active_reservations(
          static_cast<std::int64_t>(row.active_reservations));
      for (const auto peer : row.nvlink_peers) {
        device->add_nvlink_peers(peer);
      }
    }
  });
}

auto
SchedulerServiceImpl::GetQueueDepth(
    ServerContext* /*context*/, const rpc::QueueDepthRequest* /*request*/,
    rpc::QueueDepthResponse* reply) -> Status
{
  return handle_call("GetQueueDepth", verbosity_, [&] {
    for (const auto& tier : runtime_->scheduler().queue_status()) {
      auto* entry = reply->add_tiers();
      entry->set_tier(to_proto(tier.tier));
      entry->set_queued(static_cast<std::int64_t>(tier.queued));
      entry->set_active(static_cast<std::int64_t>(tier.active));
    }
  });
}

auto
SchedulerServiceImpl::ForceRelease(
    ServerContext* /*context*/, const rpc::JobRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("ForceRelease", verbosity_, [&] {
    const bool changed =
        runtime_->scheduler().force_release(request->job_id());
    reply->set_changed(changed);
    reply->set_message(changed ? "released" : "job holds no reservation");
  });
}

auto
SchedulerServiceImpl::QuarantineDevice(
    ServerContext* /*context*/, const rpc::DeviceRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("QuarantineDevice", verbosity_, [&] {
    const bool changed = runtime_->scheduler().quarantine_device(
        request->device_id(), request->reason());
    reply->set_changed(changed);
    reply->set_message(changed ? "quarantined" : "already quarantined");
  });
}

auto
SchedulerServiceImpl::RestoreDevice(
    ServerContext* /*context*/, const rpc::DeviceRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("RestoreDevice", verbosity_, [&] {
    const bool changed =
        runtime_->scheduler().restore_device(request->device_id());
    reply->set_changed(changed);
    reply->set_message(changed ? "restored" : "already healthy");
  });
}

auto
SchedulerServiceImpl::ReportDeviceMetrics(
    ServerContext* /*context*/, const rpc::DeviceMetricsRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("ReportDeviceMetrics", verbosity_, [&] {
    runtime_->registry().update_metrics(
        request->device_id(), request->utilization_pct(),
        request->temperature_c(),
        require_non_negative(request->used_vram_bytes(), "used_vram_bytes"));
    runtime_->scheduler().drain();
    reply->set_changed(true);
  });
}

auto
SchedulerServiceImpl::ReportDeviceError(
    ServerContext* /*context*/, const rpc::DeviceRequest* request,
    rpc::Ack* reply) -> Status
{
  return handle_call("ReportDeviceError", verbosity_, [&] {
    auto& health = runtime_->health();
    health.record_error(request->device_id());
    reply->set_changed(true);
    reply->set_message(
        std::to_string(health.error_count(request->device_id())) +
        " error(s) in window");
  });
}

auto
SchedulerServiceImpl::LoadModel(
    ServerContext* /*context*/, const rpc::LoadModelRequest* request,
    rpc::LoadModelResponse* reply) -> Status
{
  return handle_call("LoadModel", verbosity_, [&] {
    if (!runtime_->registry().contains(request->device_id())) {
      throw UnknownDeviceException(
          "Unknown GPU " + std::to_string(request->device_id()));
    }
    const auto model = runtime_->optimizer().load_model(
        request->device_id(), request->name(),
        require_non_negative(request->vram_bytes(), "vram_bytes"),
        request->baseline());
    reply->set_loaded(model.loaded);
    reply->set_free_vram_bytes(
        as_int64(runtime_->ledger().free_vram(request->device_id())));
  });
}

// =============================================================================
// Server lifecycle
// =============================================================================

void
RunGrpcServer(
    SchedulerRuntime& runtime, const GrpcServerOptions& options,
    std::unique_ptr<Server>& server)
{
  SchedulerServiceImpl service(runtime, options.verbosity);

  ServerBuilder builder;
  builder.AddListeningPort(options.address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  server = builder.BuildAndStart();
  if (!server) {
    log_error("Failed to start gRPC server on " + options.address);
    return;
  }
  log_info(options.verbosity, "Server listening on " + options.address);
  server->Wait();
  server.reset();
}

void
StopServer(Server* server)
{
  if (server != nullptr) {
    server->Shutdown();
  }
}

}  // namespace gpusched
