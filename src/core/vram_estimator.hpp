#pragma once

#include <array>
#include <cstddef>

#include "job.hpp"
#include "scheduling_types.hpp"

namespace gpusched {

// Supplies a VRAM figure for jobs submitted without one.
class VramEstimator {
 public:
  VramEstimator() = default;
  VramEstimator(const VramEstimator&) = default;
  auto operator=(const VramEstimator&) -> VramEstimator& = default;
  VramEstimator(VramEstimator&&) = default;
  auto operator=(VramEstimator&&) -> VramEstimator& = default;
  virtual ~VramEstimator() = default;

  [[nodiscard]] virtual auto estimate(const Job& job) const -> Bytes = 0;
};

inline constexpr Bytes kDefaultImageEstimateMiB = 12000;
inline constexpr Bytes kDefaultVideoEstimateMiB = 16000;
inline constexpr Bytes kDefaultSpeechEstimateMiB = 8000;

// Fixed figure per job kind.
class TableVramEstimator final : public VramEstimator {
 public:
  TableVramEstimator();
  TableVramEstimator(Bytes image_bytes, Bytes video_bytes, Bytes speech_bytes);

  [[nodiscard]] auto estimate(const Job& job) const -> Bytes override;

 private:
  std::array<Bytes, 3> bytes_per_kind_;
};

}  // namespace gpusched
