#include "vram_estimator.hpp"

#include <utility>

namespace gpusched {

TableVramEstimator::TableVramEstimator()
    : TableVramEstimator(
          kDefaultImageEstimateMiB * kBytesPerMiB,
          kDefaultVideoEstimateMiB * kBytesPerMiB,
          kDefaultSpeechEstimateMiB * kBytesPerMiB)
{
}

TableVramEstimator::TableVramEstimator(
    Bytes image_bytes, Bytes video_bytes, Bytes speech_bytes)
    : bytes_per_kind_{image_bytes, video_bytes, speech_bytes}
{
}

auto
TableVramEstimator::estimate(const Job& job) const -> Bytes
{
  return bytes_per_kind_.at(
      static_cast<std::size_t>(std::to_underlying(job.kind())));
}

}  // namespace gpusched
