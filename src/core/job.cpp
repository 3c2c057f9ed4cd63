#include "job.hpp"

#include <string>
#include <utility>
#include <variant>

namespace gpusched {

namespace {
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
}  // namespace

auto
kind_of(const JobPayload& payload) -> JobKind
{
  return std::visit(
      Overloaded{
          [](const ImagePayload&) { return JobKind::Image; },
          [](const VideoPayload&) { return JobKind::Video; },
          [](const SpeechPayload&) { return JobKind::Speech; }},
      payload);
}

auto
model_of(const JobPayload& payload) -> const std::string&
{
  return std::visit(
      [](const auto& typed) -> const std::string& { return typed.model; },
      payload);
}

auto
make_job(JobId id, JobPayload payload, PriorityTier tier, Bytes vram_estimate)
    -> Job
{
  Job job;
  job.id = std::move(id);
  job.payload = std::move(payload);
  job.priority_tier = tier;
  job.vram_estimate = vram_estimate;
  return job;
}

}  // namespace gpusched
