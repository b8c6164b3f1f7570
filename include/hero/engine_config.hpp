#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace hero {

struct EngineConfig {
  std::size_t window_size = 10;
  std::size_t learning_curve_window = 10;
  std::size_t clinical_min_attempts = 20;
  int max_difficulty = 10;
  double max_noise = 0.8;
  std::uint64_t seed = 1;
  // Source of "now" for due checks and report timestamps; system clock when empty.
  std::function<Timestamp()> clock;

  void validate() const;
  Timestamp now() const { return clock ? clock() : Clock::now(); }
};

} // namespace hero
