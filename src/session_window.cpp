#include "hero/session_window.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace hero {

SessionWindow::SessionWindow(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("SessionWindow capacity must be positive");
  }
}

void SessionWindow::push(const WindowEntry& entry) {
  entries_.push_back(entry);
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

WindowStats summarize(const SessionWindow& window) {
  WindowStats stats;
  stats.size = window.size();
  if (stats.size == 0) {
    return stats;
  }

  int run = 0;
  std::vector<double> rts;
  std::vector<double> positions;  // window index of each measured RT
  rts.reserve(stats.size);
  positions.reserve(stats.size);
  std::size_t position = 0;
  for (const auto& entry : window.entries()) {
    if (entry.success) {
      run = 0;
    } else {
      ++stats.failures;
      ++run;
      stats.longest_failure_run = std::max(stats.longest_failure_run, run);
    }
    if (entry.reaction_time > 0.0) {
      rts.push_back(entry.reaction_time);
      positions.push_back(static_cast<double>(position));
    }
    ++position;
  }
  stats.success_rate =
      static_cast<double>(stats.size - stats.failures) / static_cast<double>(stats.size);

  stats.measured_rts = rts.size();
  if (rts.empty()) {
    return stats;
  }
  const double n = static_cast<double>(rts.size());
  double sum = 0.0;
  for (double rt : rts) sum += rt;
  stats.rt_mean = sum / n;

  double sq = 0.0;
  for (double rt : rts) sq += (rt - stats.rt_mean) * (rt - stats.rt_mean);
  stats.rt_std = std::sqrt(sq / n);
  if (stats.rt_mean > 0.0) {
    stats.rt_cv = stats.rt_std / stats.rt_mean;
  }

  if (rts.size() > 2) {
    double x_sum = 0.0;
    for (double x : positions) x_sum += x;
    const double x_mean = x_sum / n;
    double num = 0.0;
    double den = 0.0;
    for (std::size_t i = 0; i < rts.size(); ++i) {
      const double dx = positions[i] - x_mean;
      num += dx * (rts[i] - stats.rt_mean);
      den += dx * dx;
    }
    stats.rt_slope = den > 0.0 ? num / den : 0.0;
  }
  return stats;
}

} // namespace hero
