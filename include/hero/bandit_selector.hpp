#pragma once

#include "types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace hero {

using ProfileSet = std::array<LearningProfile, kScenarioCount>;

// Thompson sampling over scenario types. Every arm keeps a Beta(alpha, beta)
// posterior over "this scenario yields learning"; selection draws one sample
// per candidate and keeps the largest.
class BanditSelector {
public:
  struct Draw {
    ScenarioType scenario = ScenarioType::Ambulance;
    double sample = 0.0;
    std::size_t attempt_count = 0;
  };

  // Fresh draws on every call. `rng_state` is owned by the caller.
  Draw select(const ProfileSet& profiles,
              const std::vector<ScenarioType>& candidates,
              std::uint64_t& rng_state) const;

  // Applies a graded reward in [0, 1]; values outside are clamped.
  void update(LearningProfile& profile, double learning_gain) const;

  static double expected_value(const LearningProfile& profile);

  // True when `challenger` beats `incumbent`: higher sample, then on an exact
  // tie the lower scenario id, then the less practiced arm.
  static bool outranks(const Draw& challenger, const Draw& incumbent);

  static constexpr double kRewardThreshold = 0.4;
  static constexpr double kMinShape = 1.0;
};

} // namespace hero
