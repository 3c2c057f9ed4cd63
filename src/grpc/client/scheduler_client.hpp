#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "ctl_args.hpp"
#include "gpu_scheduler.grpc.pb.h"
#include "utils/logger.hpp"

namespace gpusched {

// Plain-text renderings used by gpusched_ctl.
auto format_device_table(const rpc::ListDevicesResponse& response)
    -> std::string;
auto format_queue_table(const rpc::QueueDepthResponse& response)
    -> std::string;
auto format_job_status(const rpc::JobStatusResponse& response) -> std::string;

class SchedulerClient {
 public:
  explicit SchedulerClient(
      const std::shared_ptr<grpc::Channel>& channel, VerbosityLevel verbosity);

  auto ServerIsLive() -> bool;

  // Each call prints its result to stdout and returns false on RPC failure.
  auto ListDevices() -> bool;
  auto QueueDepth() -> bool;
  auto JobStatus(const std::string& job_id) -> bool;
  auto CancelJob(const std::string& job_id) -> bool;
  auto ForceRelease(const std::string& job_id) -> bool;
  auto QuarantineDevice(int device_id, const std::string& reason) -> bool;
  auto RestoreDevice(int device_id) -> bool;

  // Dispatches the parsed command line.
  auto Run(const CtlConfig& cfg) -> bool;

 private:
  auto check(const grpc::Status& status, const char* rpc_name) const -> bool;
  auto report_ack(const rpc::Ack& ack, const std::string& subject) const
      -> bool;

  std::unique_ptr<rpc::GpuScheduler::Stub> stub_;
  VerbosityLevel verbosity_;
};
}  // namespace gpusched
