#pragma once

#include <cstddef>
#include <functional>
#include <string_view>

namespace gpusched {

// Heterogeneous hash for job-id and config-key sets: std::string,
// std::string_view and literals all hash through std::string_view.
struct TransparentHash {
  using is_transparent = void;

  auto operator()(std::string_view key) const noexcept -> std::size_t
  {
    return std::hash<std::string_view>{}(key);
  }
};

}  // namespace gpusched
