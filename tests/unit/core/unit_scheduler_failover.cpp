#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "core/scheduler.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace gpusched;

namespace {
auto
ids(const std::vector<std::shared_ptr<Job>>& jobs) -> std::vector<std::string>
{
  std::vector<std::string> result;
  for (const auto& job : jobs) {
    result.push_back(job->id);
  }
  return result;
}

// GPU 1 holds 10000 bytes, GPU 2 holds 30000. After setup:
//   GPU 2: a (realtime), b (normal), c (batch), 8000 bytes each
//   GPU 1: d, 10000 bytes
//   queued: e (normal, 9000), f (batch, 9000)
class SchedulerFailoverTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    harness_.scheduler.set_executor_hooks(hooks_);
    auto& scheduler = harness_.scheduler;
    scheduler.submit(make_image_job("a", 8000, PriorityTier::Realtime));
    scheduler.submit(make_image_job("b", 8000, PriorityTier::Normal));
    scheduler.submit(make_image_job("c", 8000, PriorityTier::Batch));
    scheduler.submit(make_image_job("d", 10000, PriorityTier::Normal));
    scheduler.submit(make_image_job("e", 9000, PriorityTier::Normal));
    scheduler.submit(make_image_job("f", 9000, PriorityTier::Batch));
    scheduler.start("b");
  }

  auto tier(PriorityTier priority) const -> std::vector<std::string>
  {
    return ids(harness_.queue.peek(priority, harness_.queue.depth(priority)));
  }

  SchedulerHarness harness_{{make_device(1, 10000), make_device(2, 30000)}};
  std::shared_ptr<RecordingHooks> hooks_ = std::make_shared<RecordingHooks>();
};
}  // namespace

TEST_F(SchedulerFailoverTest, SetupPlacesJobsAsExpected)
{
  for (const auto* id : {"a", "b", "c"}) {
    EXPECT_EQ(harness_.scheduler.describe(id)->device_id, 2) << id;
  }
  EXPECT_EQ(harness_.scheduler.describe("d")->device_id, 1);
  EXPECT_EQ(harness_.scheduler.status("e"), JobState::Queued);
  EXPECT_EQ(harness_.scheduler.status("f"), JobState::Queued);
}

TEST_F(SchedulerFailoverTest, UnhealthyDeviceRequeuesItsJobsAtTierHeads)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(harness_.scheduler.quarantine_device(2, "xid 79"));

  EXPECT_EQ(tier(PriorityTier::Realtime), (std::vector<std::string>{"a"}));
  EXPECT_EQ(tier(PriorityTier::Normal), (std::vector<std::string>{"b", "e"}));
  EXPECT_EQ(tier(PriorityTier::Batch), (std::vector<std::string>{"c", "f"}));

  EXPECT_EQ(harness_.ledger.reserved_vram(2), 0U);
  EXPECT_EQ(harness_.ledger.reserved_vram(1), 10000U);
  for (const auto* id : {"a", "b", "c"}) {
    const auto job = harness_.scheduler.describe(id);
    EXPECT_EQ(job->state, JobState::Queued) << id;
    EXPECT_FALSE(job->device_id.has_value()) << id;
  }
  EXPECT_EQ(harness_.scheduler.status("d"), JobState::Admitted);

  const auto cancelled = hooks_->cancelled();
  ASSERT_EQ(cancelled.size(), 3U);
  for (const auto& [job_id, device_id] : cancelled) {
    EXPECT_EQ(device_id, 2) << job_id;
  }
  EXPECT_NE(capture.str().find("Failover of GPU 2 (xid 79)"), std::string::npos);
}

TEST_F(SchedulerFailoverTest, NewWorkAvoidsUnhealthyDevice)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(harness_.scheduler.quarantine_device(2, "xid 79"));
  harness_.scheduler.submit(make_image_job("g", 100));
  EXPECT_EQ(harness_.scheduler.status("g"), JobState::Queued);
  EXPECT_FALSE(harness_.scheduler.select_device(100).has_value());
}

TEST_F(SchedulerFailoverTest, RestoredDeviceDrainsQueueInTierOrder)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(harness_.scheduler.quarantine_device(2, "xid 79"));
  ASSERT_TRUE(harness_.scheduler.restore_device(2));

  EXPECT_EQ(harness_.scheduler.status("a"), JobState::Admitted);
  EXPECT_EQ(harness_.scheduler.describe("a")->device_id, 2);
  EXPECT_EQ(harness_.scheduler.status("b"), JobState::Admitted);
  EXPECT_EQ(harness_.scheduler.status("e"), JobState::Admitted);
  EXPECT_EQ(harness_.scheduler.status("c"), JobState::Queued);
  EXPECT_EQ(harness_.scheduler.status("f"), JobState::Queued);
  EXPECT_EQ(harness_.ledger.reserved_vram(2), 25000U);
}

TEST_F(SchedulerFailoverTest, LateCompletionOfDisplacedJob)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(harness_.scheduler.quarantine_device(2, "xid 79"));

  EXPECT_TRUE(harness_.scheduler.complete("a", true));
  EXPECT_EQ(harness_.scheduler.status("a"), JobState::Completed);
  EXPECT_FALSE(harness_.queue.contains("a"));

  EXPECT_FALSE(harness_.scheduler.complete("b", false, "cuda error"));
  EXPECT_EQ(harness_.scheduler.status("b"), JobState::Queued);
  EXPECT_TRUE(harness_.queue.contains("b"));
}

TEST_F(SchedulerFailoverTest, HealthyDeviceUnaffected)
{
  CaptureStream capture{std::cerr};
  ASSERT_TRUE(harness_.scheduler.quarantine_device(1, "fan failure"));
  EXPECT_EQ(harness_.scheduler.status("d"), JobState::Queued);
  EXPECT_EQ(harness_.ledger.reserved_vram(2), 24000U);
  for (const auto* id : {"a", "b", "c"}) {
    EXPECT_EQ(harness_.scheduler.describe(id)->device_id, 2) << id;
  }
  EXPECT_FALSE(harness_.scheduler.quarantine_device(1, "again"));
}

TEST(SchedulerFailoverReports, StaleReportFromOldDeviceIsIgnored)
{
  SchedulerHarness harness{{make_device(0, 10000), make_device(1, 20000)}};
  auto& scheduler = harness.scheduler;
  scheduler.submit(make_image_job("j", 8000));
  ASSERT_EQ(scheduler.describe("j")->device_id, 1);
  scheduler.start("j");

  CaptureStream capture{std::cerr};
  ASSERT_TRUE(scheduler.quarantine_device(1, "xid 79"));
  ASSERT_EQ(scheduler.status("j"), JobState::Admitted);
  ASSERT_EQ(scheduler.describe("j")->device_id, 0);
  ASSERT_EQ(harness.ledger.reserved_vram(0), 8000U);

  EXPECT_FALSE(scheduler.complete("j", false, "cancelled on GPU 1", 1));
  EXPECT_FALSE(scheduler.complete("j", true, {}, 1));
  EXPECT_EQ(scheduler.status("j"), JobState::Admitted);
  EXPECT_EQ(harness.ledger.reserved_vram(0), 8000U);

  EXPECT_TRUE(scheduler.complete("j", true, {}, 0));
  EXPECT_EQ(scheduler.status("j"), JobState::Completed);
  EXPECT_EQ(harness.ledger.reserved_vram(0), 0U);
}

TEST(SchedulerConcurrency, LedgerMatchesJobsUnderMixedLoad)
{
  SchedulerHarness harness(
      {make_device(0, 10000), make_device(1, 20000), make_device(2, 10000)});
  auto& scheduler = harness.scheduler;
  CaptureStream out{std::cout};
  CaptureStream err{std::cerr};

  constexpr int kWorkers = 4;
  constexpr int kJobsPerWorker = 60;
  constexpr std::array<Bytes, 3> kSizes{2000, 4000, 6000};
  constexpr std::array<PriorityTier, 4> kTiers{
      PriorityTier::Realtime, PriorityTier::High, PriorityTier::Normal,
      PriorityTier::Batch};

  std::atomic<int> workers_left{kWorkers};
  std::vector<std::thread> threads;
  for (int worker = 0; worker < kWorkers; ++worker) {
    threads.emplace_back([&, worker] {
      std::mt19937 rng(static_cast<std::mt19937::result_type>(worker + 7));
      for (int i = 0; i < kJobsPerWorker; ++i) {
        const auto id = "w" + std::to_string(worker) + "-" + std::to_string(i);
        scheduler.submit(make_image_job(
            id, kSizes[rng() % kSizes.size()], kTiers[rng() % kTiers.size()]));
        switch (rng() % 4) {
          case 0:
            try {
              scheduler.start(id);
            }
            catch (const InvalidJobTransitionException&) {
              // Still queued, or requeued by a failover.
            }
            scheduler.complete(id, rng() % 2 == 0, "exit code 1");
            break;
          case 1:
            scheduler.cancel(id);
            break;
          case 2:
            scheduler.force_release(id);
            break;
          default:
            break;
        }
      }
      workers_left.fetch_sub(1);
    });
  }
  threads.emplace_back([&] {
    DeviceId device = 0;
    while (workers_left.load() > 0) {
      scheduler.quarantine_device(device, "xid 79");
      std::this_thread::yield();
      scheduler.restore_device(device);
      device = (device + 1) % 3;
    }
  });
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& device : harness.registry.list_devices()) {
    EXPECT_TRUE(device.healthy) << device.id;
    Bytes reserved = 0;
    for (const auto& reservation : harness.ledger.reservations_on(device.id)) {
      reserved += reservation.vram_bytes;
    }
    EXPECT_EQ(reserved, harness.ledger.reserved_vram(device.id)) << device.id;
    EXPECT_LE(reserved, device.total_vram) << device.id;
  }

  std::size_t holding = 0;
  for (int worker = 0; worker < kWorkers; ++worker) {
    for (int i = 0; i < kJobsPerWorker; ++i) {
      const auto job = scheduler.describe(
          "w" + std::to_string(worker) + "-" + std::to_string(i));
      ASSERT_TRUE(job.has_value());
      if (job->state != JobState::Admitted && job->state != JobState::Running) {
        EXPECT_FALSE(harness.ledger.reservation_for(job->id).has_value())
            << job->id;
        continue;
      }
      ++holding;
      const auto reservation = harness.ledger.reservation_for(job->id);
      ASSERT_TRUE(reservation.has_value()) << job->id;
      EXPECT_EQ(job->device_id, reservation->device_id) << job->id;
    }
  }
  EXPECT_EQ(harness.ledger.reservation_count(), holding);
}
