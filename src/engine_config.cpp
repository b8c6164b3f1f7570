#include "hero/engine_config.hpp"

#include <stdexcept>

namespace hero {

void EngineConfig::validate() const {
  if (window_size == 0) {
    throw std::invalid_argument("window_size must be positive");
  }
  if (learning_curve_window == 0) {
    throw std::invalid_argument("learning_curve_window must be positive");
  }
  if (clinical_min_attempts == 0) {
    throw std::invalid_argument("clinical_min_attempts must be positive");
  }
  if (max_difficulty < 1) {
    throw std::invalid_argument("max_difficulty must be at least 1");
  }
  if (!(max_noise > 0.0) || max_noise > 1.0) {
    throw std::invalid_argument("max_noise must be within (0, 1]");
  }
}

} // namespace hero
