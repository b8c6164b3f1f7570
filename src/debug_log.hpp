#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace hero::detail {

inline bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("HERO_DEBUG_ENGINE");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(const char* channel, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << channel << "] " << message << std::endl;
  }
}

} // namespace hero::detail
