#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "core/allocation_ledger.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace gpusched;

namespace {
class AllocationLedgerTest : public ::testing::Test {
 protected:
  ManualClock clock_;
  DeviceRegistry registry_{{make_device(0, 20000), make_device(1, 10000)}};
  AllocationLedger ledger_{registry_, 0, VerbosityLevel::Silent, clock_.fn()};
};
}  // namespace

TEST_F(AllocationLedgerTest, ReserveAndReleaseAdjustFreeVram)
{
  const auto reservation =
      ledger_.try_reserve(0, "job-a", 6000, PriorityTier::High);
  EXPECT_EQ(reservation.job_id, "job-a");
  EXPECT_EQ(reservation.device_id, 0);
  EXPECT_EQ(reservation.vram_bytes, 6000U);
  EXPECT_EQ(reservation.priority_tier, PriorityTier::High);
  EXPECT_EQ(reservation.created_at, clock_.now());

  EXPECT_EQ(ledger_.free_vram(0), 14000U);
  EXPECT_EQ(ledger_.reserved_vram(0), 6000U);
  EXPECT_EQ(ledger_.reservation_count(), 1U);

  const auto released = ledger_.release("job-a");
  ASSERT_TRUE(released.has_value());
  EXPECT_EQ(released->vram_bytes, 6000U);
  EXPECT_EQ(ledger_.free_vram(0), 20000U);
}

TEST_F(AllocationLedgerTest, ReleaseIsIdempotent)
{
  ledger_.try_reserve(1, "job-a", 1000, PriorityTier::Normal);
  EXPECT_TRUE(ledger_.release("job-a").has_value());
  EXPECT_FALSE(ledger_.release("job-a").has_value());
  EXPECT_FALSE(ledger_.release("never-reserved").has_value());
  EXPECT_EQ(ledger_.reserved_vram(1), 0U);
}

TEST_F(AllocationLedgerTest, RejectsOverCommit)
{
  ledger_.try_reserve(1, "job-a", 7000, PriorityTier::Normal);
  EXPECT_THROW(
      ledger_.try_reserve(1, "job-b", 3001, PriorityTier::Normal),
      InsufficientCapacityException);
  EXPECT_NO_THROW(ledger_.try_reserve(1, "job-c", 3000, PriorityTier::Normal));
  EXPECT_EQ(ledger_.free_vram(1), 0U);
}

TEST_F(AllocationLedgerTest, RejectsZeroBytesAndDoubleReservation)
{
  CaptureStream capture{std::cerr};
  EXPECT_THROW(
      ledger_.try_reserve(0, "job-a", 0, PriorityTier::Normal),
      LedgerInvariantException);
  ledger_.try_reserve(0, "job-a", 100, PriorityTier::Normal);
  EXPECT_THROW(
      ledger_.try_reserve(1, "job-a", 100, PriorityTier::Normal),
      LedgerInvariantException);
  EXPECT_EQ(ledger_.reserved_vram(1), 0U);
}

TEST_F(AllocationLedgerTest, UnknownDeviceThrows)
{
  EXPECT_THROW(
      ledger_.try_reserve(5, "job-a", 100, PriorityTier::Normal),
      UnknownDeviceException);
  EXPECT_THROW(std::ignore = ledger_.free_vram(5), UnknownDeviceException);
}

TEST_F(AllocationLedgerTest, ReleaseDeviceReturnsCreationOrder)
{
  ledger_.try_reserve(0, "first", 1000, PriorityTier::Batch);
  ledger_.try_reserve(0, "second", 1000, PriorityTier::Realtime);
  clock_.advance(std::chrono::seconds(1));
  ledger_.try_reserve(0, "third", 1000, PriorityTier::Normal);
  ledger_.try_reserve(1, "elsewhere", 1000, PriorityTier::Normal);

  const auto released = ledger_.release_device(0);
  ASSERT_EQ(released.size(), 3U);
  EXPECT_EQ(released[0].job_id, "first");
  EXPECT_EQ(released[1].job_id, "second");
  EXPECT_EQ(released[2].job_id, "third");
  EXPECT_EQ(ledger_.reserved_vram(0), 0U);
  EXPECT_EQ(ledger_.reservation_count(), 1U);
  EXPECT_TRUE(ledger_.reservation_for("elsewhere").has_value());
}

TEST_F(AllocationLedgerTest, ExternalUsageShrinksFreeVram)
{
  ledger_.try_reserve(0, "job-a", 4000, PriorityTier::Normal);
  registry_.update_metrics(0, 50.0, 60.0, 9000);
  EXPECT_EQ(ledger_.free_vram(0), 11000U);

  registry_.update_metrics(0, 50.0, 60.0, 1000);
  EXPECT_EQ(ledger_.free_vram(0), 16000U);
}

TEST(AllocationLedger, HeadroomIsNeverHandedOut)
{
  DeviceRegistry registry({make_device(0, 10000)});
  AllocationLedger ledger(registry, 1500);
  EXPECT_EQ(ledger.headroom(), 1500U);
  EXPECT_EQ(ledger.free_vram(0), 8500U);
  EXPECT_THROW(
      ledger.try_reserve(0, "job-a", 9000, PriorityTier::Normal),
      InsufficientCapacityException);
  EXPECT_NO_THROW(ledger.try_reserve(0, "job-b", 8500, PriorityTier::Normal));
  EXPECT_EQ(ledger.free_vram(0), 0U);
}

TEST_F(AllocationLedgerTest, ResidentModelsCountAgainstCapacity)
{
  ledger_.commit_resident(1, 4000);
  EXPECT_EQ(ledger_.resident_vram(1), 4000U);
  EXPECT_EQ(ledger_.free_vram(1), 6000U);
  EXPECT_EQ(ledger_.projected_free_vram(1, 4000), 10000U);

  ledger_.try_reserve(1, "job-a", 6000, PriorityTier::Normal);
  EXPECT_EQ(ledger_.committed_vram(1), 10000U);
  EXPECT_THROW(ledger_.commit_resident(1, 1), InsufficientCapacityException);

  CaptureStream capture{std::cerr};
  EXPECT_THROW(ledger_.release_resident(1, 5000), LedgerInvariantException);
  ledger_.release_resident(1, 4000);
  EXPECT_EQ(ledger_.resident_vram(1), 0U);
}

TEST_F(AllocationLedgerTest, CommitResidentSwapsEvictedBytesInOneStep)
{
  ledger_.commit_resident(1, 6000);
  ledger_.commit_resident(1, 8000, 6000);
  EXPECT_EQ(ledger_.resident_vram(1), 8000U);
  EXPECT_EQ(ledger_.free_vram(1), 2000U);

  // A reservation takes the room the eviction would have freed.
  ledger_.try_reserve(1, "job-a", 1500, PriorityTier::Realtime);
  EXPECT_THROW(
      ledger_.commit_resident(1, 9000, 8000), InsufficientCapacityException);
  EXPECT_EQ(ledger_.resident_vram(1), 8000U);
  EXPECT_EQ(ledger_.reserved_vram(1), 1500U);

  CaptureStream capture{std::cerr};
  EXPECT_THROW(ledger_.commit_resident(1, 100, 8001), LedgerInvariantException);
  EXPECT_EQ(ledger_.resident_vram(1), 8000U);
}

TEST_F(AllocationLedgerTest, ReleaseOnlyDropsTheEntryItBooked)
{
  ledger_.try_reserve(0, "job-a", 7000, PriorityTier::Normal);
  ledger_.try_reserve(0, "job-b", 13000, PriorityTier::Normal);
  EXPECT_EQ(ledger_.free_vram(0), 0U);

  ASSERT_TRUE(ledger_.release("job-b").has_value());
  EXPECT_EQ(ledger_.reserved_vram(0), 7000U);
  ASSERT_TRUE(ledger_.reservation_for("job-a").has_value());
  EXPECT_EQ(ledger_.reservation_count(), 1U);

  ASSERT_TRUE(ledger_.release("job-a").has_value());
  EXPECT_EQ(ledger_.reserved_vram(0), 0U);
  EXPECT_EQ(ledger_.reservation_count(), 0U);
}

TEST_F(AllocationLedgerTest, ReservationsOnListsOneDevice)
{
  ledger_.try_reserve(0, "a", 100, PriorityTier::Normal);
  ledger_.try_reserve(1, "b", 100, PriorityTier::Normal);
  ledger_.try_reserve(0, "c", 100, PriorityTier::Normal);
  const auto on_zero = ledger_.reservations_on(0);
  ASSERT_EQ(on_zero.size(), 2U);
  EXPECT_EQ(on_zero[0].job_id, "a");
  EXPECT_EQ(on_zero[1].job_id, "c");
  EXPECT_EQ(ledger_.reservations().size(), 3U);
}

TEST(AllocationLedgerConcurrency, NeverOverCommitsUnderContention)
{
  constexpr int kThreads = 16;
  constexpr int kAttemptsPerThread = 10;
  DeviceRegistry registry({make_device(0, 20000)});
  AllocationLedger ledger(registry);

  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int thread_idx = 0; thread_idx < kThreads; ++thread_idx) {
    threads.emplace_back([&, thread_idx] {
      for (int attempt = 0; attempt < kAttemptsPerThread; ++attempt) {
        const std::string id =
            "job-" + std::to_string(thread_idx) + "-" + std::to_string(attempt);
        try {
          ledger.try_reserve(0, id, 1000, PriorityTier::Normal);
          successes.fetch_add(1);
        }
        catch (const InsufficientCapacityException&) {
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 20);
  EXPECT_EQ(ledger.reserved_vram(0), 20000U);
  EXPECT_EQ(ledger.free_vram(0), 0U);
}
