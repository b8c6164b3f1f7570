#include "hero/types.hpp"

#include <cmath>
#include <string>

namespace hero {

void validate_attempt(const AttemptRecord& attempt) {
  if (attempt.user_id.empty()) {
    throw std::invalid_argument("Attempt rejected: user_id must not be empty");
  }
  if (scenario_index(attempt.scenario) >= kScenarioCount) {
    throw std::invalid_argument("Attempt rejected: unknown scenario type");
  }
  if (!std::isfinite(attempt.reaction_time) || attempt.reaction_time < 0.0) {
    throw std::invalid_argument("Attempt rejected: reaction_time must be a finite value >= 0, got " +
                                std::to_string(attempt.reaction_time));
  }
  if (attempt.difficulty_level < 1) {
    throw std::invalid_argument("Attempt rejected: difficulty_level must be >= 1, got " +
                                std::to_string(attempt.difficulty_level));
  }
  if (!std::isfinite(attempt.noise_level) || attempt.noise_level < 0.0 ||
      attempt.noise_level > 1.0) {
    throw std::invalid_argument("Attempt rejected: noise_level must be within [0, 1], got " +
                                std::to_string(attempt.noise_level));
  }
}

} // namespace hero
