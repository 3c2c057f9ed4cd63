#include <gtest/gtest.h>
#include <prometheus/metric_family.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "monitoring/metrics.hpp"

using namespace gpusched;

namespace {
auto
FindFamily(
    const std::vector<prometheus::MetricFamily>& families,
    std::string_view name) -> const prometheus::MetricFamily*
{
  auto iter = std::ranges::find_if(
      families, [name](const auto& family) { return family.name == name; });
  return iter == families.end() ? nullptr : &*iter;
}

auto
FindLabelled(
    const prometheus::MetricFamily& family, std::string_view label,
    std::string_view value) -> std::optional<prometheus::ClientMetric>
{
  for (const auto& metric : family.metric) {
    for (const auto& pair : metric.label) {
      if (pair.name == label && pair.value == value) {
        return metric;
      }
    }
  }
  return std::nullopt;
}

class MetricsTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    shutdown_metrics();
    ASSERT_TRUE(init_metrics(0));
  }
  void TearDown() override { shutdown_metrics(); }

  [[nodiscard]] static auto collect() -> std::vector<prometheus::MetricFamily>
  {
    return get_metrics()->registry->Collect();
  }
};

class RecordingExposer : public MetricsRegistry::ExposerHandle {
 public:
  explicit RecordingExposer(int* registered, int* removed)
      : registered_(registered), removed_(removed)
  {
  }
  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    ++*registered_;
  }
  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    ++*removed_;
  }

 private:
  int* registered_;
  int* removed_;
};
}  // namespace

TEST_F(MetricsTest, UnlabelledCountersExistFromStart)
{
  auto metrics = get_metrics();
  ASSERT_NE(metrics, nullptr);
  ASSERT_NE(metrics->evictions_total, nullptr);
  ASSERT_NE(metrics->failovers_total, nullptr);

  const auto families = collect();
  EXPECT_NE(FindFamily(families, "gpu_evictions_total"), nullptr);
  EXPECT_NE(FindFamily(families, "gpu_failovers_total"), nullptr);
}

TEST_F(MetricsTest, HelpersUpdateLabelledFamilies)
{
  set_queue_depth("realtime", 4);
  increment_jobs_submitted("video");
  increment_jobs_submitted("video");
  increment_jobs_finished("timeout");
  observe_queue_wait("batch", 12.5);
  increment_device_errors(3);
  increment_evictions(2);
  increment_failovers();

  const auto families = collect();
  const auto* depth = FindFamily(families, "scheduler_queue_depth");
  ASSERT_NE(depth, nullptr);
  auto realtime = FindLabelled(*depth, "tier", "realtime");
  ASSERT_TRUE(realtime.has_value());
  EXPECT_DOUBLE_EQ(realtime->gauge.value, 4.0);

  const auto* submitted = FindFamily(families, "scheduler_jobs_submitted_total");
  ASSERT_NE(submitted, nullptr);
  auto video = FindLabelled(*submitted, "kind", "video");
  ASSERT_TRUE(video.has_value());
  EXPECT_DOUBLE_EQ(video->counter.value, 2.0);

  const auto* finished = FindFamily(families, "scheduler_jobs_finished_total");
  ASSERT_NE(finished, nullptr);
  EXPECT_TRUE(FindLabelled(*finished, "outcome", "timeout").has_value());

  const auto* wait = FindFamily(families, "scheduler_queue_wait_seconds");
  ASSERT_NE(wait, nullptr);
  auto batch = FindLabelled(*wait, "tier", "batch");
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->histogram.sample_count, 1U);

  const auto* errors = FindFamily(families, "gpu_errors_total");
  ASSERT_NE(errors, nullptr);
  EXPECT_TRUE(FindLabelled(*errors, "gpu", "3").has_value());

  EXPECT_DOUBLE_EQ(get_metrics()->evictions_total->Value(), 2.0);
  EXPECT_DOUBLE_EQ(get_metrics()->failovers_total->Value(), 1.0);
}

TEST_F(MetricsTest, DeviceGaugesArePublishedPerGpu)
{
  publish_device_gauges(
      DeviceGaugeSample{1, 8000.0, 3000.0, 5000.0, 40.0, 61.0, false});

  const auto families = collect();
  const auto* free = FindFamily(families, "gpu_vram_free_bytes");
  ASSERT_NE(free, nullptr);
  auto gpu1 = FindLabelled(*free, "gpu", "1");
  ASSERT_TRUE(gpu1.has_value());
  EXPECT_DOUBLE_EQ(gpu1->gauge.value, 5000.0);

  const auto* healthy = FindFamily(families, "gpu_healthy");
  ASSERT_NE(healthy, nullptr);
  auto health = FindLabelled(*healthy, "gpu", "1");
  ASSERT_TRUE(health.has_value());
  EXPECT_DOUBLE_EQ(health->gauge.value, 0.0);
}

TEST_F(MetricsTest, RepeatedInitKeepsFirstRegistry)
{
  auto first = get_metrics();
  EXPECT_FALSE(init_metrics(0));
  EXPECT_EQ(get_metrics(), first);
}

TEST(Metrics, HelpersAreNoOpsBeforeInit)
{
  shutdown_metrics();
  EXPECT_EQ(get_metrics(), nullptr);
  increment_failovers();
  increment_evictions(1);
  set_queue_depth("normal", 1);
  publish_device_gauges(DeviceGaugeSample{});
  EXPECT_EQ(get_metrics(), nullptr);
}

TEST(Metrics, InjectedExposerSeesRegistryLifetime)
{
  int registered = 0;
  int removed = 0;
  {
    MetricsRegistry metrics(
        0, std::make_unique<RecordingExposer>(&registered, &removed));
    EXPECT_EQ(registered, 1);
    EXPECT_EQ(removed, 0);
  }
  EXPECT_EQ(removed, 1);
}
