#include "hero/memory_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace hero {
namespace {

constexpr double kSecondsPerDay = 86400.0;

Timestamp add_days(Timestamp start, double days) {
  const auto offset = std::chrono::duration<double>(days * kSecondsPerDay);
  return start + std::chrono::duration_cast<Clock::duration>(offset);
}

} // namespace

int MemoryScheduler::quality(double reaction_time, bool success) {
  if (success) {
    if (reaction_time <= 0.0) {
      return 4;  // unmeasured
    }
    if (reaction_time < kPerfectRt) return 5;
    if (reaction_time < kEasyRt) return 4;
    if (reaction_time < kHesitantRt) return 3;
    return 2;
  }
  const bool near_miss = reaction_time > 0.0 && reaction_time <= kNearMissWindow;
  return near_miss ? 1 : 0;
}

SkillMemoryState MemoryScheduler::initial_state(Timestamp now) {
  SkillMemoryState state;
  state.easiness_factor = kInitialEasiness;
  state.interval_days = kMinIntervalDays;
  state.repetitions = 0;
  state.last_review = now;
  state.next_due = now;
  return state;
}

void MemoryScheduler::update(SkillMemoryState& state, int quality, Timestamp reviewed_at) const {
  const int q = std::clamp(quality, 0, 5);
  const double easiness = std::max(kMinEasiness, state.easiness_factor);

  if (q >= 3) {
    if (state.repetitions <= 0) {
      state.interval_days = kMinIntervalDays;
    } else if (state.repetitions == 1) {
      state.interval_days = kSecondIntervalDays;
    } else {
      state.interval_days = state.interval_days * easiness;
    }
    state.repetitions += 1;
  } else {
    state.interval_days = kMinIntervalDays;
    state.repetitions = 0;
  }
  state.interval_days = std::max(kMinIntervalDays, state.interval_days);

  const double miss = static_cast<double>(5 - q);
  state.easiness_factor = std::max(kMinEasiness, easiness + (0.1 - miss * (0.08 + miss * 0.02)));

  state.last_review = reviewed_at;
  state.next_due = add_days(reviewed_at, state.interval_days);
}

double MemoryScheduler::memory_strength(const SkillMemoryState& state, Timestamp now) {
  const double elapsed_days = std::max(0.0, seconds_between(state.last_review, now) / kSecondsPerDay);
  const double stability = std::max(kMinEasiness, state.easiness_factor) *
                           std::max(kMinIntervalDays, state.interval_days);
  return detail::clip01(std::exp(-elapsed_days / stability));
}

bool MemoryScheduler::is_due(const SkillMemoryState& state, Timestamp now) const {
  if (now >= state.next_due) {
    return true;
  }
  return memory_strength(state, now) < kForgettingThreshold;
}

std::vector<ScenarioType> MemoryScheduler::due_scenarios(const MemorySet& states,
                                                         Timestamp now) const {
  std::vector<std::pair<Timestamp, ScenarioType>> due;
  for (ScenarioType scenario : kAllScenarios) {
    const auto& state = states[scenario_index(scenario)];
    if (state.has_value() && is_due(*state, now)) {
      due.emplace_back(state->next_due, scenario);
    }
  }
  std::sort(due.begin(), due.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) {
      return a.first < b.first;
    }
    return scenario_index(a.second) < scenario_index(b.second);
  });
  std::vector<ScenarioType> ordered;
  ordered.reserve(due.size());
  for (const auto& entry : due) {
    ordered.push_back(entry.second);
  }
  return ordered;
}

} // namespace hero
