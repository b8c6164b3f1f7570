#include "hero/flow_detector.hpp"

namespace hero {

FlowAssessment FlowStateDetector::assess(const SessionWindow& window) const {
  return assess(summarize(window));
}

FlowAssessment FlowStateDetector::assess(const WindowStats& stats) const {
  FlowAssessment flow;
  flow.success_rate = stats.success_rate;
  flow.rt_cv = stats.rt_cv;
  flow.longest_failure_run = stats.longest_failure_run;
  flow.consistency_score = stats.rt_cv.has_value() ? 1.0 / (1.0 + *stats.rt_cv) : 0.5;

  if (stats.size < kMinEntries) {
    flow.in_flow = false;
    flow.signal = AdaptiveSignal::NoChange;
    flow.reason = "insufficient_data";
    return flow;
  }

  const double rate = stats.success_rate;
  const bool optimal_success = rate >= kFlowSuccessMin && rate <= kFlowSuccessMax;
  const bool consistent = stats.rt_cv.has_value() && *stats.rt_cv < kMaxFlowCv;
  const bool no_streak = stats.longest_failure_run < kFailureStreak;
  flow.in_flow = optimal_success && consistent && no_streak;

  if (rate < kDecreaseBelow) {
    flow.signal = AdaptiveSignal::DecreaseDifficulty;
    flow.reason = "success_rate_low";
  } else if (rate > kIncreaseAbove) {
    flow.signal = AdaptiveSignal::IncreaseDifficulty;
    flow.reason = "success_rate_high";
  } else if (flow.in_flow) {
    flow.signal = AdaptiveSignal::Maintain;
    flow.reason = "optimal_challenge";
  } else {
    flow.signal = AdaptiveSignal::NoChange;
    if (!no_streak) {
      flow.reason = "failure_streak";
    } else if (rate < kFlowSuccessMin) {
      flow.reason = "below_flow_band";
    } else if (rate > kFlowSuccessMax) {
      flow.reason = "above_flow_band";
    } else {
      flow.reason = "inconsistent_timing";
    }
  }
  return flow;
}

} // namespace hero
