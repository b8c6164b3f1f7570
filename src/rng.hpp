#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace hero {

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

// Decorrelates (seed, stream) pairs so neighbouring streams do not share a prefix.
inline std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t stream) {
  std::uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (stream + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  z ^= z >> 31;
  return z == 0 ? 1 : z;
}

// Uniform on the open interval (0, 1).
inline double rand_open_unit(std::uint64_t& state) {
  const double value = static_cast<double>(advance_rng(state) >> 11) + 0.5;
  return value / 9007199254740992.0;  // 2^53
}

inline double rand_normal(std::uint64_t& state) {
  const double u1 = rand_open_unit(state);
  const double u2 = rand_open_unit(state);
  constexpr double two_pi = 6.283185307179586;
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(two_pi * u2);
}

// Marsaglia-Tsang; shapes below 1 use the U^(1/shape) boost.
inline double rand_gamma(std::uint64_t& state, double shape) {
  if (!(shape > 0.0)) {
    throw std::invalid_argument("rand_gamma: shape must be positive");
  }
  if (shape < 1.0) {
    const double boost = std::pow(rand_open_unit(state), 1.0 / shape);
    return rand_gamma(state, shape + 1.0) * boost;
  }
  const double d = shape - 1.0 / 3.0;
  const double c = 1.0 / std::sqrt(9.0 * d);
  for (;;) {
    double x = 0.0;
    double v = 0.0;
    do {
      x = rand_normal(state);
      v = 1.0 + c * x;
    } while (v <= 0.0);
    v = v * v * v;
    const double u = rand_open_unit(state);
    if (u < 1.0 - 0.0331 * x * x * x * x) {
      return d * v;
    }
    if (std::log(u) < 0.5 * x * x + d * (1.0 - v + std::log(v))) {
      return d * v;
    }
  }
}

inline double rand_beta(std::uint64_t& state, double alpha, double beta) {
  const double x = rand_gamma(state, alpha);
  const double y = rand_gamma(state, beta);
  const double sum = x + y;
  if (sum <= 0.0) {
    return 0.5;
  }
  return x / sum;
}

} // namespace hero
