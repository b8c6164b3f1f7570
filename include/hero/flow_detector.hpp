#pragma once

#include "session_window.hpp"
#include "types.hpp"

namespace hero {

// Optimal-challenge detection: moderate success, steady timing, no failure streak.
class FlowStateDetector {
public:
  FlowAssessment assess(const SessionWindow& window) const;
  FlowAssessment assess(const WindowStats& stats) const;

  static constexpr std::size_t kMinEntries = 5;
  static constexpr double kFlowSuccessMin = 0.60;
  static constexpr double kFlowSuccessMax = 0.85;
  static constexpr double kMaxFlowCv = 0.3;
  static constexpr int kFailureStreak = 3;
  static constexpr double kDecreaseBelow = 0.40;
  static constexpr double kIncreaseAbove = 0.90;
};

} // namespace hero
