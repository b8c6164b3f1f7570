#include "hero/bandit_selector.hpp"

#include "rng.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace hero {

BanditSelector::Draw BanditSelector::select(const ProfileSet& profiles,
                                            const std::vector<ScenarioType>& candidates,
                                            std::uint64_t& rng_state) const {
  if (candidates.empty()) {
    throw std::invalid_argument("BanditSelector::select called with no candidates");
  }

  std::optional<Draw> best;
  for (ScenarioType scenario : candidates) {
    const auto index = scenario_index(scenario);
    if (index >= profiles.size()) {
      throw std::out_of_range("BanditSelector::select scenario index out of range");
    }
    const auto& profile = profiles[index];
    const double alpha = std::max(kMinShape, profile.alpha);
    const double beta = std::max(kMinShape, profile.beta);
    Draw draw{scenario, rand_beta(rng_state, alpha, beta), profile.attempt_count};
    if (!best.has_value() || outranks(draw, *best)) {
      best = draw;
    }
  }
  return *best;
}

void BanditSelector::update(LearningProfile& profile, double learning_gain) const {
  const double gain = detail::clip01(learning_gain);
  if (gain > kRewardThreshold) {
    profile.alpha += gain;
  } else {
    profile.beta += 1.0 - gain;
  }
  profile.alpha = std::max(kMinShape, profile.alpha);
  profile.beta = std::max(kMinShape, profile.beta);
  profile.attempt_count += 1;
}

bool BanditSelector::outranks(const Draw& challenger, const Draw& incumbent) {
  if (challenger.sample != incumbent.sample) {
    return challenger.sample > incumbent.sample;
  }
  const auto challenger_id = scenario_index(challenger.scenario);
  const auto incumbent_id = scenario_index(incumbent.scenario);
  if (challenger_id != incumbent_id) {
    return challenger_id < incumbent_id;
  }
  return challenger.attempt_count < incumbent.attempt_count;
}

double BanditSelector::expected_value(const LearningProfile& profile) {
  const double alpha = std::max(kMinShape, profile.alpha);
  const double beta = std::max(kMinShape, profile.beta);
  return alpha / (alpha + beta);
}

} // namespace hero
