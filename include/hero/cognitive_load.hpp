#pragma once

#include "session_window.hpp"
#include "types.hpp"

namespace hero {

// Weighted fatigue/frustration estimate over the session window.
class CognitiveLoadEstimator {
public:
  CognitiveLoad estimate(const SessionWindow& window) const;
  CognitiveLoad estimate(const WindowStats& stats) const;

  static LoadLevel level_for(double load);
  static Intervention intervention_for(double load);

  static constexpr std::size_t kMinEntries = 3;
  static constexpr double kNeutralLoad = 0.5;
  static constexpr double kTrendGain = 10.0;  // 0.1 s/attempt of slowdown saturates the trend term

  static constexpr double kWeightVariance = 0.25;
  static constexpr double kWeightTrend = 0.25;
  static constexpr double kWeightErrors = 0.30;
  static constexpr double kWeightClustering = 0.20;

  static constexpr double kModerateLoad = 0.3;
  static constexpr double kHighLoad = 0.6;
  static constexpr double kBreakLoad = 0.7;
};

} // namespace hero
