#pragma once

#include "types.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace hero {

// Most-recent-N ring of graded reactions for one user.
class SessionWindow {
public:
  explicit SessionWindow(std::size_t capacity = kDefaultCapacity);

  void push(const WindowEntry& entry);
  void clear() { entries_.clear(); }

  const std::deque<WindowEntry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return entries_.empty(); }

  static constexpr std::size_t kDefaultCapacity = 10;

private:
  std::size_t capacity_;
  std::deque<WindowEntry> entries_;
};

// Summary statistics shared by the load estimator and the flow detector.
// Reaction-time figures only consider measured reactions (rt > 0).
struct WindowStats {
  std::size_t size = 0;
  std::size_t failures = 0;
  double success_rate = 0.0;
  int longest_failure_run = 0;
  std::size_t measured_rts = 0;
  double rt_mean = 0.0;
  double rt_std = 0.0;             // population standard deviation
  std::optional<double> rt_cv;     // unset when no measured RT or mean is 0
  double rt_slope = 0.0;           // seconds per attempt, least squares
};

WindowStats summarize(const SessionWindow& window);

} // namespace hero
