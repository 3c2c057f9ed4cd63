#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/health_monitor.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace gpusched;

namespace {
auto
test_policy() -> HealthPolicy
{
  HealthPolicy policy;
  policy.interval = std::chrono::milliseconds(10);
  policy.temperature_limit_c = 85.0;
  policy.error_threshold = 2;
  policy.error_window = std::chrono::seconds(60);
  policy.recovery_sweeps = 3;
  return policy;
}

class HealthMonitorTest : public ::testing::Test {
 protected:
  void record_errors(DeviceId device_id, int count)
  {
    for (int idx = 0; idx < count; ++idx) {
      monitor_.record_error(device_id);
    }
  }

  ManualClock clock_;
  DeviceRegistry registry_{
      std::vector<Device>{make_device(0, 10000), make_device(1, 10000)}};
  HealthMonitor monitor_{
      registry_, test_policy(), VerbosityLevel::Silent, clock_.fn()};
};
}  // namespace

TEST_F(HealthMonitorTest, HealthyFleetProducesNoTransitions)
{
  const auto result = monitor_.sweep();
  EXPECT_TRUE(result.quarantined.empty());
  EXPECT_TRUE(result.recovered.empty());
  EXPECT_EQ(result.alerts, 0U);
}

TEST_F(HealthMonitorTest, OverheatingDeviceIsQuarantined)
{
  CaptureStream capture{std::cerr};
  registry_.update_metrics(1, 40.0, 92.0, 0);
  const auto result = monitor_.sweep();

  ASSERT_EQ(result.quarantined, (std::vector<DeviceId>{1}));
  EXPECT_FALSE(registry_.is_healthy(1));
  EXPECT_TRUE(registry_.is_healthy(0));
  EXPECT_NE(
      registry_.find_device(1)->unhealthy_reason.find("temperature"),
      std::string::npos);
}

TEST_F(HealthMonitorTest, ErrorsAboveThresholdQuarantine)
{
  CaptureStream capture{std::cerr};
  record_errors(0, 2);
  EXPECT_EQ(monitor_.error_count(0), 2U);
  EXPECT_TRUE(monitor_.sweep().quarantined.empty());

  monitor_.record_error(0);
  const auto result = monitor_.sweep();
  EXPECT_EQ(result.quarantined, (std::vector<DeviceId>{0}));
  EXPECT_NE(
      registry_.find_device(0)->unhealthy_reason.find("3 errors within 60 s"),
      std::string::npos);
}

TEST_F(HealthMonitorTest, ErrorsOutsideWindowAreForgotten)
{
  record_errors(0, 2);
  clock_.advance(std::chrono::seconds(61));
  monitor_.record_error(0);
  EXPECT_EQ(monitor_.error_count(0), 1U);
  EXPECT_TRUE(monitor_.sweep().quarantined.empty());
}

TEST_F(HealthMonitorTest, RecoversAfterConsecutiveCleanSweeps)
{
  CaptureStream capture{std::cerr};
  registry_.update_metrics(0, 10.0, 95.0, 0);
  ASSERT_EQ(monitor_.sweep().quarantined.size(), 1U);

  registry_.update_metrics(0, 10.0, 60.0, 0);
  EXPECT_TRUE(monitor_.sweep().recovered.empty());
  EXPECT_TRUE(monitor_.sweep().recovered.empty());
  const auto result = monitor_.sweep();
  EXPECT_EQ(result.recovered, (std::vector<DeviceId>{0}));
  EXPECT_TRUE(registry_.is_healthy(0));
}

TEST_F(HealthMonitorTest, BreachDuringRecoveryRestartsCount)
{
  CaptureStream capture{std::cerr};
  registry_.update_metrics(0, 10.0, 95.0, 0);
  ASSERT_EQ(monitor_.sweep().quarantined.size(), 1U);

  registry_.update_metrics(0, 10.0, 60.0, 0);
  monitor_.sweep();
  monitor_.sweep();
  registry_.update_metrics(0, 10.0, 90.0, 0);
  monitor_.sweep();
  registry_.update_metrics(0, 10.0, 60.0, 0);
  EXPECT_TRUE(monitor_.sweep().recovered.empty());
  EXPECT_TRUE(monitor_.sweep().recovered.empty());
  EXPECT_FALSE(registry_.is_healthy(0));
  EXPECT_EQ(monitor_.sweep().recovered, (std::vector<DeviceId>{0}));
}

TEST_F(HealthMonitorTest, OperatorQuarantineIsNeverLifted)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(registry_.mark_unhealthy(1, "quarantined by operator"));
  for (int sweep = 0; sweep < 5; ++sweep) {
    EXPECT_TRUE(monitor_.sweep().recovered.empty());
  }
  EXPECT_FALSE(registry_.is_healthy(1));
}

TEST_F(HealthMonitorTest, HighUtilizationAndMemoryRaiseAlerts)
{
  CaptureStream capture{std::cerr};
  registry_.update_metrics(0, 99.0, 50.0, 9800);
  const auto result = monitor_.sweep();
  EXPECT_EQ(result.alerts, 2U);
  EXPECT_TRUE(result.quarantined.empty());
  EXPECT_NE(capture.str().find("GPU 0 utilization at"), std::string::npos);
  EXPECT_NE(capture.str().find("GPU 0 memory usage at"), std::string::npos);
}

TEST_F(HealthMonitorTest, RecordErrorOnUnknownDeviceThrows)
{
  EXPECT_THROW(monitor_.record_error(7), UnknownDeviceException);
  EXPECT_EQ(monitor_.error_count(7), 0U);
}

TEST_F(HealthMonitorTest, StartAndStop)
{
  EXPECT_FALSE(monitor_.running());
  monitor_.start();
  EXPECT_TRUE(monitor_.running());
  monitor_.stop();
  EXPECT_FALSE(monitor_.running());
  monitor_.stop();
}

TEST(HealthMonitorFailover, QuarantineRequeuesRunningWork)
{
  SchedulerHarness harness({make_device(0, 10000), make_device(1, 10000)});
  HealthMonitor monitor(
      harness.registry, test_policy(), VerbosityLevel::Silent,
      harness.clock.fn());

  harness.scheduler.submit(make_image_job("first", 6000));
  harness.scheduler.submit(make_image_job("second", 6000));
  const auto first_device = harness.scheduler.describe("first")->device_id;
  ASSERT_TRUE(first_device.has_value());
  harness.scheduler.start("first");

  CaptureStream capture{std::cerr};
  harness.registry.update_metrics(*first_device, 30.0, 97.0, 0);
  ASSERT_EQ(
      monitor.sweep().quarantined, (std::vector<DeviceId>{*first_device}));

  EXPECT_EQ(harness.scheduler.status("first"), JobState::Queued);
  EXPECT_EQ(harness.ledger.reserved_vram(*first_device), 0U);
  EXPECT_EQ(harness.scheduler.status("second"), JobState::Admitted);
  EXPECT_NE(capture.str().find("Failover of GPU"), std::string::npos);
}
