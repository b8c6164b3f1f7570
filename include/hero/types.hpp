#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace hero {

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

} // namespace detail

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline double seconds_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double>(to - from).count();
}

inline std::int64_t to_epoch_ms(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(std::int64_t ms) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

//-----------------------------------------------------------------
// SCENARIOS
//-----------------------------------------------------------------
enum class ScenarioType {
  Ambulance = 0,
  Police = 1,
  Firetruck = 2,
  Train = 3,
  IceCream = 4
};

constexpr std::size_t kScenarioCount = 5;

constexpr std::array<ScenarioType, kScenarioCount> kAllScenarios = {
    ScenarioType::Ambulance, ScenarioType::Police, ScenarioType::Firetruck,
    ScenarioType::Train, ScenarioType::IceCream};

inline std::size_t scenario_index(ScenarioType scenario) {
  return static_cast<std::size_t>(scenario);
}

inline std::string to_string(ScenarioType scenario) {
  switch (scenario) {
    case ScenarioType::Ambulance: return "ambulance";
    case ScenarioType::Police: return "police";
    case ScenarioType::Firetruck: return "firetruck";
    case ScenarioType::Train: return "train";
    case ScenarioType::IceCream: return "ice_cream";
  }
  return "ambulance";
}

inline ScenarioType scenario_from_string(const std::string& value) {
  for (ScenarioType scenario : kAllScenarios) {
    if (to_string(scenario) == value) {
      return scenario;
    }
  }
  throw std::invalid_argument("Unknown scenario type: " + value);
}

struct ScenarioCue {
  const char* action;
  const char* visual_cue;
};

inline ScenarioCue scenario_cue(ScenarioType scenario) {
  switch (scenario) {
    case ScenarioType::Ambulance: return {"Move Right", "Flashing Red/White Lights"};
    case ScenarioType::Police: return {"Stay Center", "Flashing Blue/Red Lights"};
    case ScenarioType::Firetruck: return {"Move Left", "Flashing Red Lights"};
    case ScenarioType::Train: return {"Stop", "Railway Crossing"};
    case ScenarioType::IceCream: return {"Slow Down", "Ice Cream Truck"};
  }
  return {"Move Right", "Flashing Red/White Lights"};
}

//-----------------------------------------------------------------
// INPUT RECORDS
//-----------------------------------------------------------------
struct AttemptRecord {
  std::string user_id;
  ScenarioType scenario = ScenarioType::Ambulance;
  bool success = false;
  double reaction_time = 0.0;  // seconds, 0 = not measured
  int difficulty_level = 1;
  double noise_level = 0.0;
  Timestamp timestamp{};
};

// Throws std::invalid_argument describing the first offending field.
void validate_attempt(const AttemptRecord& attempt);

//-----------------------------------------------------------------
// PER-USER MODEL STATE
//-----------------------------------------------------------------
struct LearningProfile {
  double alpha = 1.0;
  double beta = 1.0;
  std::size_t attempt_count = 0;
};

struct SkillMemoryState {
  double easiness_factor = 2.5;
  double interval_days = 1.0;
  int repetitions = 0;
  Timestamp last_review{};
  Timestamp next_due{};
};

struct WindowEntry {
  double reaction_time = 0.0;
  bool success = false;
  Timestamp timestamp{};
};

//-----------------------------------------------------------------
// SCORES
//-----------------------------------------------------------------
struct Undetermined {};

inline bool operator==(Undetermined, Undetermined) { return true; }

using Score = std::variant<double, Undetermined>;

inline bool is_determined(const Score& score) {
  return std::holds_alternative<double>(score);
}

inline std::optional<double> score_value(const Score& score) {
  if (const auto* value = std::get_if<double>(&score)) {
    return *value;
  }
  return std::nullopt;
}

//-----------------------------------------------------------------
// ANALYSIS RESULTS
//-----------------------------------------------------------------
enum class LoadLevel { Low, Moderate, High };

inline std::string to_string(LoadLevel level) {
  switch (level) {
    case LoadLevel::Low: return "low";
    case LoadLevel::Moderate: return "moderate";
    case LoadLevel::High: return "high";
  }
  return "low";
}

enum class Intervention { None, LowerNoise, SuggestBreak };

inline std::string to_string(Intervention intervention) {
  switch (intervention) {
    case Intervention::None: return "none";
    case Intervention::LowerNoise: return "lower_noise";
    case Intervention::SuggestBreak: return "suggest_break";
  }
  return "none";
}

enum class AdaptiveSignal { DecreaseDifficulty, IncreaseDifficulty, Maintain, NoChange };

inline std::string to_string(AdaptiveSignal signal) {
  switch (signal) {
    case AdaptiveSignal::DecreaseDifficulty: return "decrease_difficulty";
    case AdaptiveSignal::IncreaseDifficulty: return "increase_difficulty";
    case AdaptiveSignal::Maintain: return "maintain";
    case AdaptiveSignal::NoChange: return "no_change";
  }
  return "no_change";
}

struct LoadComponents {
  double rt_variance = 0.0;
  double rt_trend = 0.0;
  double error_rate = 0.0;
  double error_clustering = 0.0;
};

struct CognitiveLoad {
  double value = 0.5;
  LoadLevel level = LoadLevel::Moderate;
  Intervention intervention = Intervention::None;
  LoadComponents components;
  bool sufficient_data = false;
};

struct FlowAssessment {
  bool in_flow = false;
  AdaptiveSignal signal = AdaptiveSignal::NoChange;
  std::string reason;
  double success_rate = 0.0;
  std::optional<double> rt_cv;
  double consistency_score = 0.5;
  int longest_failure_run = 0;
};

struct Recommendation {
  ScenarioType scenario = ScenarioType::Ambulance;
  std::string action;
  std::string visual_cue;
  int difficulty_level = 1;
  double noise_level = 0.0;
  double speed_modifier = 1.0;
  std::string reason;
  double cognitive_load = 0.5;
  bool in_flow_state = false;
  AdaptiveSignal adaptive_signal = AdaptiveSignal::NoChange;
  Intervention intervention = Intervention::None;
};

struct CognitiveStatus {
  double cognitive_load = 0.5;
  LoadLevel load_level = LoadLevel::Moderate;
  FlowAssessment flow_state;
  std::string recommendation;
};

enum class Interpretation { Excellent, Good, Developing, NeedsEvaluation };

inline std::string to_string(Interpretation value) {
  switch (value) {
    case Interpretation::Excellent: return "excellent";
    case Interpretation::Good: return "good";
    case Interpretation::Developing: return "developing";
    case Interpretation::NeedsEvaluation: return "needs_evaluation";
  }
  return "needs_evaluation";
}

struct ClinicalAssessment {
  Score figure_ground = Undetermined{};
  Score temporal_processing = Undetermined{};
  Score localization = Undetermined{};
  Score attention_span_seconds = Undetermined{};
  bool attention_span_censored = false;
  Score composite = Undetermined{};
  std::optional<Interpretation> interpretation;
  std::vector<std::string> strengths;
  std::vector<std::string> improvement_areas;
  std::size_t attempt_count = 0;
  Timestamp computed_at{};
};

struct InsufficientData {
  std::size_t attempt_count = 0;
  std::size_t required_attempts = 0;
};

using ClinicalResult = std::variant<ClinicalAssessment, InsufficientData>;

struct ClinicalRecommendation {
  std::string area;
  std::string severity;
  std::string suggestion;
  std::string clinical_note;
};

struct LearningCurvePoint {
  std::size_t attempt_index = 0;  // 1-based
  double moving_average_success = 0.0;
  bool success = false;
  int difficulty_level = 1;
  ScenarioType scenario = ScenarioType::Ambulance;
  Timestamp timestamp{};
};

struct ScenarioBreakdown {
  ScenarioType scenario = ScenarioType::Ambulance;
  std::size_t attempts = 0;
  double success_rate = 0.0;        // percent
  double avg_reaction_time = 0.0;   // seconds, measured RTs only
};

struct ProgressReport {
  std::size_t total_attempts = 0;
  double success_rate = 0.0;        // percent
  double avg_reaction_time = 0.0;
  double improvement_rate = 0.0;    // percent points, last quarter minus first quarter
  std::vector<ScenarioBreakdown> scenarios;
  CognitiveStatus current_state;
  std::vector<ClinicalRecommendation> recommendations;
  std::vector<std::string> next_steps;
  Timestamp generated_at{};
};

} // namespace hero
