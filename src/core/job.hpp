#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "scheduling_types.hpp"

namespace gpusched {
// =============================================================================
// Typed job payloads, resolved at the API boundary
// =============================================================================

struct ImagePayload {
  std::string model;
  std::string prompt;
  int width = 1024;
  int height = 1024;
  int steps = 30;
  int batch_size = 1;
};

struct VideoPayload {
  std::string model;
  int width = 1280;
  int height = 720;
  int frames = 48;
  int fps = 24;
};

struct SpeechPayload {
  std::string model;
  std::string voice;
  std::string text;
};

using JobPayload = std::variant<ImagePayload, VideoPayload, SpeechPayload>;

[[nodiscard]] auto kind_of(const JobPayload& payload) -> JobKind;
[[nodiscard]] auto model_of(const JobPayload& payload) -> const std::string&;

// =============================================================================
// Job: one unit of GPU work tracked by the scheduler
// -----------------------------------------------------------------------------
// vram_estimate == 0 asks the scheduler to fill it from its VramEstimator.
// =============================================================================

struct Job {
  JobId id;
  JobPayload payload;
  Bytes vram_estimate = 0;
  PriorityTier priority_tier = PriorityTier::Normal;
  JobState state = JobState::Queued;
  Clock::time_point submitted_at{};
  Clock::time_point queued_at{};
  std::optional<DeviceId> device_id;
  std::string failure_reason;

  [[nodiscard]] auto kind() const -> JobKind { return kind_of(payload); }
  [[nodiscard]] auto model_name() const -> const std::string&
  {
    return model_of(payload);
  }
};

auto make_job(
    JobId id, JobPayload payload, PriorityTier tier,
    Bytes vram_estimate = 0) -> Job;

}  // namespace gpusched
