#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "core/job.hpp"
#include "core/scheduler_runtime.hpp"
#include "core/scheduling_types.hpp"
#include "gpu_scheduler.grpc.pb.h"
#include "utils/logger.hpp"

namespace gpusched {

// =============================================================================
// Conversions between the wire types and the scheduler's own types
// =============================================================================

// PRIORITY_TIER_UNSPECIFIED maps to Normal.
auto to_priority_tier(rpc::PriorityTier tier) -> PriorityTier;
auto to_proto(PriorityTier tier) -> rpc::PriorityTier;
auto to_proto(JobState state) -> rpc::JobState;
auto to_proto(JobKind kind) -> rpc::JobKind;

// Resolves the request's payload into a typed Job. Throws
// InvalidJobException for a missing payload or a negative estimate.
auto job_from_request(const rpc::SubmitJobRequest& request) -> Job;

// =============================================================================
// SchedulerServiceImpl
// -----------------------------------------------------------------------------
// Synchronous gRPC front door. Every handler translates scheduler exceptions
// into a grpc::Status; nothing escapes into the gRPC runtime.
// =============================================================================

class SchedulerServiceImpl final : public rpc::GpuScheduler::Service {
 public:
  explicit SchedulerServiceImpl(
      SchedulerRuntime& runtime,
      VerbosityLevel verbosity = VerbosityLevel::Silent);

  auto ServerLive(
      grpc::ServerContext* context, const rpc::ServerLiveRequest* request,
      rpc::ServerLiveResponse* reply) -> grpc::Status override;

  auto SubmitJob(
      grpc::ServerContext* context, const rpc::SubmitJobRequest* request,
      rpc::SubmitJobResponse* reply) -> grpc::Status override;

  auto CancelJob(
      grpc::ServerContext* context, const rpc::JobRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto GetJobStatus(
      grpc::ServerContext* context, const rpc::JobRequest* request,
      rpc::JobStatusResponse* reply) -> grpc::Status override;

  auto StartJob(
      grpc::ServerContext* context, const rpc::JobRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto CompleteJob(
      grpc::ServerContext* context, const rpc::CompleteJobRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto ListDevices(
      grpc::ServerContext* context, const rpc::ListDevicesRequest* request,
      rpc::ListDevicesResponse* reply) -> grpc::Status override;

  auto GetQueueDepth(
      grpc::ServerContext* context, const rpc::QueueDepthRequest* request,
      rpc::QueueDepthResponse* reply) -> grpc::Status override;

  auto ForceRelease(
      grpc::ServerContext* context, const rpc::JobRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto QuarantineDevice(
      grpc::ServerContext* context, const rpc::DeviceRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto RestoreDevice(
      grpc::ServerContext* context, const rpc::DeviceRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto ReportDeviceMetrics(
      grpc::ServerContext* context, const rpc::DeviceMetricsRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto ReportDeviceError(
      grpc::ServerContext* context, const rpc::DeviceRequest* request,
      rpc::Ack* reply) -> grpc::Status override;

  auto LoadModel(
      grpc::ServerContext* context, const rpc::LoadModelRequest* request,
      rpc::LoadModelResponse* reply) -> grpc::Status override;

 private:
  SchedulerRuntime* runtime_;
  VerbosityLevel verbosity_;
};

struct GrpcServerOptions {
  std::string address;
  VerbosityLevel verbosity;
};

// Blocks until StopServer is called from another thread.
void RunGrpcServer(
    SchedulerRuntime& runtime, const GrpcServerOptions& options,
    std::unique_ptr<grpc::Server>& server);

void StopServer(grpc::Server* server);

}  // namespace gpusched
