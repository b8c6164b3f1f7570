#pragma once

#include "types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace hero {

using MemorySet = std::array<std::optional<SkillMemoryState>, kScenarioCount>;

// SM-2 spaced repetition with an exponential forgetting-curve override.
class MemoryScheduler {
public:
  // Maps a graded attempt to SM-2 quality 0..5.
  static int quality(double reaction_time, bool success);

  // Fresh state for a scenario that has never been reviewed.
  static SkillMemoryState initial_state(Timestamp now);

  void update(SkillMemoryState& state, int quality, Timestamp reviewed_at) const;

  bool is_due(const SkillMemoryState& state, Timestamp now) const;

  // exp(-elapsed_days / (EF * interval_days)), in [0, 1].
  static double memory_strength(const SkillMemoryState& state, Timestamp now);

  // Due scenarios ordered by next_due, ties broken by lowest scenario id.
  std::vector<ScenarioType> due_scenarios(const MemorySet& states, Timestamp now) const;

  static constexpr double kInitialEasiness = 2.5;
  static constexpr double kMinEasiness = 1.3;
  static constexpr double kMinIntervalDays = 1.0;
  static constexpr double kSecondIntervalDays = 6.0;
  static constexpr double kForgettingThreshold = 0.5;
  static constexpr double kPerfectRt = 1.5;
  static constexpr double kEasyRt = 2.5;
  static constexpr double kHesitantRt = 4.0;
  static constexpr double kNearMissWindow = 5.0;  // a wrong answer given within this many seconds
};

} // namespace hero
