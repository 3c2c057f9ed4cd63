#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "grpc/client/scheduler_client.hpp"
#include "grpc/server/scheduler_service.hpp"
#include "test_helpers.hpp"

using namespace gpusched;

namespace {
constexpr std::int64_t kWireMiB = static_cast<std::int64_t>(kBytesPerMiB);

auto
client_config() -> RuntimeConfig
{
  RuntimeConfig cfg;
  cfg.telemetry.enabled = false;
  cfg.estimator.image_mib = 1;
  cfg.estimator.video_mib = 2;
  cfg.estimator.speech_mib = 1;
  return cfg;
}

class SchedulerClientTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    grpc::ServerBuilder builder;
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    client_ = std::make_unique<SchedulerClient>(
        server_->InProcessChannel(grpc::ChannelArguments{}),
        VerbosityLevel::Silent);
  }

  void TearDown() override
  {
    client_.reset();
    server_->Shutdown();
  }

  void submit(const std::string& job_id, std::int64_t bytes)
  {
    rpc::SubmitJobRequest request;
    request.set_job_id(job_id);
    request.set_vram_estimate_bytes(bytes);
    request.mutable_speech()->set_model("whisper");
    rpc::SubmitJobResponse reply;
    ASSERT_TRUE(service_.SubmitJob(nullptr, &request, &reply).ok());
  }

  SchedulerRuntime runtime_{
      client_config(),
      std::vector<Device>{
          make_device(0, 4 * kBytesPerMiB, "L4"),
          make_device(1, 8 * kBytesPerMiB, "A10")}};
  SchedulerServiceImpl service_{runtime_};
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<SchedulerClient> client_;
};
}  // namespace

TEST(SchedulerClientFormat, DeviceTableShowsMiBAndHealth)
{
  rpc::ListDevicesResponse response;
  auto* healthy = response.add_devices();
  healthy->set_id(0);
  healthy->set_name("A100");
  healthy->set_total_vram_bytes(80 * kWireMiB);
  healthy->set_reserved_vram_bytes(16 * kWireMiB);
  healthy->set_free_vram_bytes(64 * kWireMiB);
  healthy->set_healthy(true);
  auto* sick = response.add_devices();
  sick->set_id(1);
  sick->set_name("L4");
  sick->set_healthy(false);
  sick->set_unhealthy_reason("xid 79");

  const auto table = format_device_table(response);
  EXPECT_EQ(table.rfind("GPU", 0), 0U);
  EXPECT_NE(table.find("A100"), std::string::npos);
  EXPECT_NE(table.find("        80"), std::string::npos);
  EXPECT_NE(table.find("        64"), std::string::npos);
  EXPECT_NE(table.find("healthy\n"), std::string::npos);
  EXPECT_NE(table.find("quarantined (xid 79)\n"), std::string::npos);
  EXPECT_TRUE(table.ends_with("VRAM figures in MiB\n"));
}

TEST(SchedulerClientFormat, QueueTableListsTiersInOrder)
{
  rpc::QueueDepthResponse response;
  auto* realtime = response.add_tiers();
  realtime->set_tier(rpc::PRIORITY_TIER_REALTIME);
  realtime->set_queued(2);
  realtime->set_active(1);
  auto* batch = response.add_tiers();
  batch->set_tier(rpc::PRIORITY_TIER_BATCH);
  batch->set_queued(7);

  const auto table = format_queue_table(response);
  const auto realtime_row = table.find("realtime");
  const auto batch_row = table.find("batch");
  EXPECT_EQ(table.rfind("TIER", 0), 0U);
  ASSERT_NE(realtime_row, std::string::npos);
  ASSERT_NE(batch_row, std::string::npos);
  EXPECT_LT(realtime_row, batch_row);
  EXPECT_NE(table.find("       7       0\n"), std::string::npos);
}

TEST(SchedulerClientFormat, JobStatusShowsQueueDetailsOnlyWhileQueued)
{
  rpc::JobStatusResponse queued;
  queued.set_job_id("img-7");
  queued.set_state(rpc::JOB_STATE_QUEUED);
  queued.set_kind(rpc::JOB_KIND_IMAGE);
  queued.set_priority(rpc::PRIORITY_TIER_HIGH);
  queued.set_vram_estimate_bytes(3 * kWireMiB);
  queued.set_waited_seconds(12);
  queued.set_queue_position(4);

  const auto text = format_job_status(queued);
  EXPECT_EQ(
      text,
      "job:      img-7\n"
      "state:    queued\n"
      "kind:     image\n"
      "priority: high\n"
      "vram:     3 MiB\n"
      "waited:   12 s\n"
      "position: 4\n");

  rpc::JobStatusResponse failed;
  failed.set_job_id("img-8");
  failed.set_state(rpc::JOB_STATE_FAILED);
  failed.set_has_device(true);
  failed.set_device_id(1);
  failed.set_failure_reason("force released");
  const auto failed_text = format_job_status(failed);
  EXPECT_NE(failed_text.find("gpu:      1\n"), std::string::npos);
  EXPECT_NE(failed_text.find("reason:   force released\n"), std::string::npos);
  EXPECT_EQ(failed_text.find("position:"), std::string::npos);
}

TEST_F(SchedulerClientTest, ServerIsLive)
{
  EXPECT_TRUE(client_->ServerIsLive());
}

TEST_F(SchedulerClientTest, DevicesCommandPrintsTable)
{
  submit("speech-1", 3 * kWireMiB);
  CtlConfig cfg;
  cfg.command = CtlCommand::Devices;

  CaptureStream capture{std::cout};
  ASSERT_TRUE(client_->Run(cfg));
  const auto output = capture.str();
  EXPECT_NE(output.find("L4"), std::string::npos);
  EXPECT_NE(output.find("A10"), std::string::npos);
  EXPECT_TRUE(output.ends_with("VRAM figures in MiB\n"));
}

TEST_F(SchedulerClientTest, QueuesCommandPrintsEveryTier)
{
  CtlConfig cfg;
  cfg.command = CtlCommand::Queues;

  CaptureStream capture{std::cout};
  ASSERT_TRUE(client_->Run(cfg));
  const auto output = capture.str();
  for (const auto* tier : {"realtime", "high", "normal", "batch"}) {
    EXPECT_NE(output.find(tier), std::string::npos) << tier;
  }
}

TEST_F(SchedulerClientTest, StatusAndCancelCommands)
{
  submit("speech-1", 1 * kWireMiB);

  CtlConfig status;
  status.command = CtlCommand::Status;
  status.job_id = "speech-1";
  {
    CaptureStream capture{std::cout};
    ASSERT_TRUE(client_->Run(status));
    EXPECT_NE(capture.str().find("state:    admitted\n"), std::string::npos);
    EXPECT_NE(capture.str().find("gpu:      1\n"), std::string::npos);
  }

  CtlConfig cancel;
  cancel.command = CtlCommand::Cancel;
  cancel.job_id = "speech-1";
  {
    CaptureStream capture{std::cout};
    ASSERT_TRUE(client_->Run(cancel));
    EXPECT_EQ(capture.str(), "cancel speech-1: done (cancelled)\n");
  }
  {
    CaptureStream capture{std::cout};
    ASSERT_TRUE(client_->Run(cancel));
    EXPECT_EQ(
        capture.str(), "cancel speech-1: unchanged (job already finished)\n");
  }
}

TEST_F(SchedulerClientTest, ForceReleaseCommand)
{
  submit("speech-1", 1 * kWireMiB);
  CtlConfig cfg;
  cfg.command = CtlCommand::ForceRelease;
  cfg.job_id = "speech-1";

  CaptureStream capture{std::cout};
  ASSERT_TRUE(client_->Run(cfg));
  EXPECT_EQ(capture.str(), "force-release speech-1: done (released)\n");
  EXPECT_EQ(runtime_.ledger().reserved_vram(1), 0U);
}

TEST_F(SchedulerClientTest, QuarantineAndRestoreCommands)
{
  CtlConfig quarantine;
  quarantine.command = CtlCommand::Quarantine;
  quarantine.device_id = 0;
  quarantine.reason = "fan failure";
  {
    CaptureStream capture{std::cout};
    CaptureStream warnings{std::cerr};
    ASSERT_TRUE(client_->Run(quarantine));
    EXPECT_EQ(capture.str(), "quarantine GPU 0: done (quarantined)\n");
  }
  EXPECT_FALSE(runtime_.registry().find_device(0)->healthy);

  CtlConfig restore;
  restore.command = CtlCommand::Restore;
  restore.device_id = 0;
  {
    CaptureStream capture{std::cout};
    CaptureStream warnings{std::cerr};
    ASSERT_TRUE(client_->Run(restore));
    EXPECT_EQ(capture.str(), "restore GPU 0: done (restored)\n");
  }
  EXPECT_TRUE(runtime_.registry().find_device(0)->healthy);
}

TEST_F(SchedulerClientTest, RpcErrorsAreReportedOnStderr)
{
  CtlConfig cfg;
  cfg.command = CtlCommand::Status;
  cfg.job_id = "ghost";

  CaptureStream capture{std::cerr};
  EXPECT_FALSE(client_->Run(cfg));
  const auto err = capture.str();
  EXPECT_NE(err.find("GetJobStatus failed: "), std::string::npos);
  EXPECT_NE(
      err.find(
          "(code " +
          std::to_string(static_cast<int>(grpc::StatusCode::NOT_FOUND)) + ")"),
      std::string::npos);
}

TEST_F(SchedulerClientTest, RunWithoutCommandFails)
{
  CaptureStream capture{std::cerr};
  EXPECT_FALSE(client_->Run(CtlConfig{}));
  EXPECT_EQ(capture.str(), expected_log_line(ErrorLevel, "No command given"));
}
