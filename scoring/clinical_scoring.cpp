#include "clinical_scoring.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <utility>

namespace hero::scoring {
namespace {

double median(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  const std::size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[mid];
  }
  return 0.5 * (values[mid - 1] + values[mid]);
}

std::vector<double> measured_rts(const std::vector<AttemptRecord>& attempts) {
  std::vector<double> rts;
  rts.reserve(attempts.size());
  for (const auto& a : attempts) {
    if (a.reaction_time > 0.0) {
      rts.push_back(a.reaction_time);
    }
  }
  return rts;
}

double mean_of(const std::vector<double>& values) {
  double total = 0.0;
  for (double v : values) total += v;
  return total / static_cast<double>(values.size());
}

double population_std(const std::vector<double>& values, double mean) {
  double sq = 0.0;
  for (double v : values) sq += (v - mean) * (v - mean);
  return std::sqrt(sq / static_cast<double>(values.size()));
}

} // namespace

void ClinicalScoringConfig::validate() const {
  if (min_attempts == 0) {
    throw std::invalid_argument("min_attempts must be positive");
  }
  if (high_noise_threshold < 0.0 || high_noise_threshold > 1.0) {
    throw std::invalid_argument("high_noise_threshold must be within [0, 1]");
  }
  if (fatigue_window == 0) {
    throw std::invalid_argument("fatigue_window must be positive");
  }
  if (fatigue_success_rate < 0.0 || fatigue_success_rate > 1.0) {
    throw std::invalid_argument("fatigue_success_rate must be within [0, 1]");
  }
  if (session_gap_seconds <= 0.0) {
    throw std::invalid_argument("session_gap_seconds must be positive");
  }
}

ClinicalScorer::ClinicalScorer() {
  config_.validate();
}

ClinicalScorer::ClinicalScorer(ClinicalScoringConfig config) : config_(std::move(config)) {
  config_.validate();
}

ClinicalResult ClinicalScorer::assess(const std::vector<AttemptRecord>& history,
                                      Timestamp now) const {
  if (history.size() < config_.min_attempts) {
    return InsufficientData{history.size(), config_.min_attempts};
  }

  ClinicalAssessment assessment;
  assessment.attempt_count = history.size();
  assessment.computed_at = now;
  assessment.figure_ground = figure_ground(history);
  assessment.temporal_processing = temporal_processing(history);
  assessment.localization = localization(history);
  const auto span = attention_span(history);
  assessment.attention_span_seconds = span.seconds;
  assessment.attention_span_censored = span.censored;
  assessment.composite = composite(assessment.figure_ground, assessment.temporal_processing,
                                   assessment.localization);
  fill_interpretation(assessment);
  return assessment;
}

Score ClinicalScorer::figure_ground(const std::vector<AttemptRecord>& history) const {
  std::size_t total = 0;
  std::size_t correct = 0;
  for (const auto& a : history) {
    if (a.noise_level > config_.high_noise_threshold) {
      ++total;
      if (a.success) ++correct;
    }
  }
  if (total == 0) {
    return Undetermined{};
  }
  return 100.0 * static_cast<double>(correct) / static_cast<double>(total);
}

Score ClinicalScorer::temporal_processing(const std::vector<AttemptRecord>& history) const {
  const auto rts = measured_rts(history);
  if (rts.size() < 2) {
    return Undetermined{};
  }
  const double mean = mean_of(rts);
  if (mean <= 0.0) {
    return Undetermined{};
  }
  const double std_dev = population_std(rts, mean);
  return std::clamp(100.0 - 100.0 * std_dev / mean, 0.0, 100.0);
}

Score ClinicalScorer::localization(const std::vector<AttemptRecord>& history) const {
  if (history.empty()) {
    return Undetermined{};
  }
  return 100.0 * aggregate_accuracy(history);
}

AttentionSpan ClinicalScorer::attention_span(const std::vector<AttemptRecord>& history) const {
  AttentionSpan span;
  const auto sessions = split_sessions(sorted_by_time(history), config_.session_gap_seconds);
  const std::size_t window = config_.fatigue_window;

  std::vector<double> fatigue_points;
  std::optional<double> longest_session;
  for (const auto& session : sessions) {
    if (session.size() < window) {
      continue;
    }
    const Timestamp start = session.front().timestamp;
    const double duration = seconds_between(start, session.back().timestamp);
    longest_session = std::max(longest_session.value_or(0.0), duration);

    for (std::size_t i = 0; i + window <= session.size(); ++i) {
      std::size_t correct = 0;
      for (std::size_t j = i; j < i + window; ++j) {
        if (session[j].success) ++correct;
      }
      const double rate = static_cast<double>(correct) / static_cast<double>(window);
      if (rate < config_.fatigue_success_rate) {
        fatigue_points.push_back(seconds_between(start, session[i].timestamp));
        break;
      }
    }
  }

  if (!fatigue_points.empty()) {
    span.seconds = median(std::move(fatigue_points));
    span.censored = false;
  } else if (longest_session.has_value()) {
    span.seconds = *longest_session;
    span.censored = true;
  }
  return span;
}

Score ClinicalScorer::composite(const Score& figure_ground, const Score& temporal,
                                const Score& localization) {
  double total = 0.0;
  int defined = 0;
  for (const Score* score : {&figure_ground, &temporal, &localization}) {
    if (auto value = score_value(*score)) {
      total += *value;
      ++defined;
    }
  }
  if (defined == 0) {
    return Undetermined{};
  }
  return total / static_cast<double>(defined);
}

Interpretation ClinicalScorer::interpret(double composite) {
  if (composite >= 80.0) return Interpretation::Excellent;
  if (composite >= 65.0) return Interpretation::Good;
  if (composite >= 50.0) return Interpretation::Developing;
  return Interpretation::NeedsEvaluation;
}

void ClinicalScorer::fill_interpretation(ClinicalAssessment& assessment) const {
  if (auto value = score_value(assessment.composite)) {
    assessment.interpretation = interpret(*value);
  }

  const std::array<std::pair<const Score*, std::pair<const char*, const char*>>, 3> areas = {{
      {&assessment.figure_ground, {"Figure-ground discrimination", "Noise filtering ability"}},
      {&assessment.temporal_processing, {"Temporal processing", "Processing speed consistency"}},
      {&assessment.localization, {"Sound identification", "Sound recognition accuracy"}},
  }};
  for (const auto& [score, labels] : areas) {
    const auto value = score_value(*score);
    if (!value) continue;
    if (*value >= config_.strength_score) {
      assessment.strengths.emplace_back(labels.first);
    }
    if (*value < config_.improvement_score) {
      assessment.improvement_areas.emplace_back(labels.second);
    }
  }
  const auto span = score_value(assessment.attention_span_seconds);
  if (span && !assessment.attention_span_censored && *span < config_.short_attention_seconds) {
    assessment.improvement_areas.emplace_back("Sustained attention");
  }

  if (assessment.strengths.empty()) {
    assessment.strengths.emplace_back("Building foundation");
  }
  if (assessment.improvement_areas.empty()) {
    assessment.improvement_areas.emplace_back("Continue current program");
  }
}

std::vector<ClinicalRecommendation> ClinicalScorer::recommendations(
    const std::vector<AttemptRecord>& history, double cognitive_load) const {
  std::vector<ClinicalRecommendation> out;
  if (history.size() < kMinRecommendationAttempts) {
    out.push_back({"data_collection", "info", "Continue practicing to gather baseline data",
                   "Minimum " + std::to_string(config_.min_attempts) +
                       " attempts needed for meaningful assessment"});
    return out;
  }

  std::array<std::size_t, kScenarioCount> totals{};
  std::array<std::size_t, kScenarioCount> successes{};
  for (const auto& a : history) {
    totals[scenario_index(a.scenario)] += 1;
    if (a.success) successes[scenario_index(a.scenario)] += 1;
  }
  for (ScenarioType scenario : kAllScenarios) {
    const auto i = scenario_index(scenario);
    if (totals[i] <= kMinScenarioAttempts) continue;
    const double rate = static_cast<double>(successes[i]) / static_cast<double>(totals[i]);
    const std::string name = display_name(scenario);
    if (rate < 0.5) {
      out.push_back({name + " Recognition", "high_priority",
                     "Increase exposure to " + to_string(scenario) +
                         " sounds in controlled environment",
                     "Consider frequency-specific hearing assessment"});
    } else if (rate < 0.7) {
      out.push_back({name + " Recognition", "moderate",
                     "Additional practice recommended for " + to_string(scenario) + " scenarios",
                     "Monitor progress over next 2 weeks"});
    }
  }

  const auto rts = measured_rts(history);
  if (rts.size() > kMinScenarioAttempts) {
    const double mean = mean_of(rts);
    if (mean > 0.0 && population_std(rts, mean) / mean > kHighRtCv) {
      out.push_back({"Attention Consistency", "moderate",
                     "Implement shorter, more frequent training sessions (10-15 min)",
                     "High RT variability may indicate attention difficulties"});
    }
  }

  if (cognitive_load > kSustainedLoad) {
    out.push_back({"Cognitive Load Management", "high_priority",
                   "Reduce session duration and difficulty temporarily",
                   "Signs of sustained cognitive overload detected"});
  }
  return out;
}

ProgressReport ClinicalScorer::progress_report(const std::vector<AttemptRecord>& history,
                                               Timestamp since, double cognitive_load,
                                               Timestamp now) const {
  ProgressReport report;
  report.generated_at = now;

  std::vector<AttemptRecord> period;
  for (const auto& a : sorted_by_time(history)) {
    if (a.timestamp >= since) {
      period.push_back(a);
    }
  }
  report.total_attempts = period.size();
  if (period.empty()) {
    return report;
  }

  report.success_rate = 100.0 * aggregate_accuracy(period);
  report.avg_reaction_time = average_response_time(period);

  const std::size_t quarter = std::max<std::size_t>(1, period.size() / 4);
  const std::vector<AttemptRecord> first(period.begin(), period.begin() + quarter);
  const std::vector<AttemptRecord> last(period.end() - quarter, period.end());
  report.improvement_rate = 100.0 * (aggregate_accuracy(last) - aggregate_accuracy(first));

  for (ScenarioType scenario : kAllScenarios) {
    std::vector<AttemptRecord> subset;
    for (const auto& a : period) {
      if (a.scenario == scenario) subset.push_back(a);
    }
    if (subset.empty()) continue;
    ScenarioBreakdown entry;
    entry.scenario = scenario;
    entry.attempts = subset.size();
    entry.success_rate = 100.0 * aggregate_accuracy(subset);
    entry.avg_reaction_time = average_response_time(subset);
    report.scenarios.push_back(entry);
  }

  report.recommendations = recommendations(history, cognitive_load);
  return report;
}

std::vector<std::string> ClinicalScorer::next_steps(const ProgressReport& report) {
  std::vector<std::string> steps;
  const auto& state = report.current_state;
  if (state.cognitive_load > kSustainedLoad) {
    steps.emplace_back("Take a 10-minute break before next session");
    steps.emplace_back("Reduce session duration to 10-15 minutes");
  } else if (state.flow_state.in_flow) {
    steps.emplace_back("Continue current difficulty level");
    steps.emplace_back("Aim for 20-30 minute sessions");
  }

  std::string weak;
  for (const auto& entry : report.scenarios) {
    if (entry.success_rate < 60.0) {
      if (!weak.empty()) weak += ", ";
      weak += to_string(entry.scenario);
    }
  }
  if (!weak.empty()) {
    steps.push_back("Focus practice on: " + weak);
  }

  for (const auto& rec : report.recommendations) {
    if (rec.severity == "high_priority") {
      steps.push_back(rec.suggestion);
      break;
    }
  }
  if (steps.empty()) {
    steps.emplace_back("Continue current training program");
  }
  return steps;
}

std::vector<AttemptRecord> sorted_by_time(const std::vector<AttemptRecord>& history) {
  std::vector<AttemptRecord> ordered = history;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const AttemptRecord& a, const AttemptRecord& b) {
                     return a.timestamp < b.timestamp;
                   });
  return ordered;
}

std::vector<std::vector<AttemptRecord>> split_sessions(const std::vector<AttemptRecord>& ordered,
                                                       double gap_seconds) {
  std::vector<std::vector<AttemptRecord>> sessions;
  for (const auto& a : ordered) {
    if (sessions.empty() ||
        seconds_between(sessions.back().back().timestamp, a.timestamp) > gap_seconds) {
      sessions.emplace_back();
    }
    sessions.back().push_back(a);
  }
  return sessions;
}

double aggregate_accuracy(const std::vector<AttemptRecord>& attempts) {
  if (attempts.empty()) {
    return 0.0;
  }
  int correct = 0;
  for (const auto& a : attempts) {
    if (a.success) {
      ++correct;
    }
  }
  return static_cast<double>(correct) / static_cast<double>(attempts.size());
}

double average_response_time(const std::vector<AttemptRecord>& attempts) {
  const auto rts = measured_rts(attempts);
  if (rts.empty()) {
    return 0.0;
  }
  return mean_of(rts);
}

std::string display_name(ScenarioType scenario) {
  switch (scenario) {
    case ScenarioType::Ambulance: return "Ambulance";
    case ScenarioType::Police: return "Police";
    case ScenarioType::Firetruck: return "Firetruck";
    case ScenarioType::Train: return "Train";
    case ScenarioType::IceCream: return "Ice Cream";
  }
  return "Ambulance";
}

} // namespace hero::scoring
