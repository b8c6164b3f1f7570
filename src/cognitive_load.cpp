#include "hero/cognitive_load.hpp"

#include <algorithm>

namespace hero {

CognitiveLoad CognitiveLoadEstimator::estimate(const SessionWindow& window) const {
  return estimate(summarize(window));
}

CognitiveLoad CognitiveLoadEstimator::estimate(const WindowStats& stats) const {
  CognitiveLoad load;
  if (stats.size < kMinEntries) {
    load.value = kNeutralLoad;
    load.level = level_for(load.value);
    load.intervention = Intervention::None;
    load.sufficient_data = false;
    return load;
  }

  const double size = static_cast<double>(stats.size);
  auto& c = load.components;
  c.rt_variance = detail::clip01(stats.rt_cv.value_or(0.0));
  c.rt_trend = detail::clip01(std::max(0.0, stats.rt_slope * kTrendGain));
  c.error_rate = detail::clip01(static_cast<double>(stats.failures) / size);
  c.error_clustering = detail::clip01(static_cast<double>(stats.longest_failure_run) / size);

  load.value = detail::clip01(kWeightVariance * c.rt_variance + kWeightTrend * c.rt_trend +
                              kWeightErrors * c.error_rate +
                              kWeightClustering * c.error_clustering);
  load.level = level_for(load.value);
  load.intervention = intervention_for(load.value);
  load.sufficient_data = true;
  return load;
}

LoadLevel CognitiveLoadEstimator::level_for(double load) {
  if (load < kModerateLoad) {
    return LoadLevel::Low;
  }
  if (load < kHighLoad) {
    return LoadLevel::Moderate;
  }
  return LoadLevel::High;
}

Intervention CognitiveLoadEstimator::intervention_for(double load) {
  if (load >= kBreakLoad) {
    return Intervention::SuggestBreak;
  }
  if (load >= kHighLoad) {
    return Intervention::LowerNoise;
  }
  return Intervention::None;
}

} // namespace hero
