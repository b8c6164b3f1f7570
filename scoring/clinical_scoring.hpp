#pragma once

#include "hero/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hero::scoring {

struct ClinicalScoringConfig {
  std::size_t min_attempts = 20;
  double high_noise_threshold = 0.5;
  std::size_t fatigue_window = 5;
  double fatigue_success_rate = 0.5;
  double session_gap_seconds = 30.0 * 60.0;
  double strength_score = 70.0;
  double improvement_score = 60.0;
  double short_attention_seconds = 180.0;

  void validate() const;
};

struct AttentionSpan {
  Score seconds = Undetermined{};
  bool censored = false;
};

// Standardized progress scores computed from a user's complete attempt log.
class ClinicalScorer {
public:
  ClinicalScorer();
  explicit ClinicalScorer(ClinicalScoringConfig config);

  const ClinicalScoringConfig& config() const noexcept { return config_; }

  ClinicalResult assess(const std::vector<AttemptRecord>& history, Timestamp now) const;

  Score figure_ground(const std::vector<AttemptRecord>& history) const;
  Score temporal_processing(const std::vector<AttemptRecord>& history) const;
  Score localization(const std::vector<AttemptRecord>& history) const;
  AttentionSpan attention_span(const std::vector<AttemptRecord>& history) const;

  static Score composite(const Score& figure_ground, const Score& temporal,
                         const Score& localization);
  static Interpretation interpret(double composite);

  std::vector<ClinicalRecommendation> recommendations(const std::vector<AttemptRecord>& history,
                                                      double cognitive_load) const;

  // Fills every ProgressReport field except current_state and next_steps.
  ProgressReport progress_report(const std::vector<AttemptRecord>& history, Timestamp since,
                                 double cognitive_load, Timestamp now) const;

  static std::vector<std::string> next_steps(const ProgressReport& report);

  static constexpr std::size_t kMinRecommendationAttempts = 10;
  static constexpr std::size_t kMinScenarioAttempts = 5;
  static constexpr double kHighRtCv = 0.5;
  static constexpr double kSustainedLoad = 0.7;

private:
  void fill_interpretation(ClinicalAssessment& assessment) const;

  ClinicalScoringConfig config_{};
};

std::vector<AttemptRecord> sorted_by_time(const std::vector<AttemptRecord>& history);

// Splits a time-ordered log into sessions separated by gaps longer than `gap_seconds`.
std::vector<std::vector<AttemptRecord>> split_sessions(const std::vector<AttemptRecord>& ordered,
                                                       double gap_seconds);

double aggregate_accuracy(const std::vector<AttemptRecord>& attempts);

// Mean over measured reaction times (rt > 0); 0 when none were measured.
double average_response_time(const std::vector<AttemptRecord>& attempts);

std::string display_name(ScenarioType scenario);

} // namespace hero::scoring
