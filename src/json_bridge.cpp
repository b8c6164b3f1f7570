#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace hero::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj[key];
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

[[noreturn]] void throw_expected_integer(std::string_view key) {
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

// Accepts integral JSON numbers (and floats, rounded) that fit in [min, max].
// Callers pass min <= 0.
std::int64_t json_to_bounded(const nlohmann::json& value, std::string_view key, std::int64_t min,
                             std::int64_t max) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (max < 0 || v > static_cast<std::uint64_t>(max)) {
      throw_expected_integer(key);
    }
    return static_cast<std::int64_t>(v);
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v < min || v > max) {
      throw_expected_integer(key);
    }
    return v;
  }
  if (value.is_number_float()) {
    const double v = std::round(value.get<double>());
    // 2^63 is exact as a double; anything at or above it overflows int64.
    if (!std::isfinite(v) || v < static_cast<double>(min) || v >= 9223372036854775808.0 ||
        v > static_cast<double>(max)) {
      throw_expected_integer(key);
    }
    return static_cast<std::int64_t>(v);
  }
  throw_expected_integer(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  return static_cast<int>(json_to_bounded(value, key, std::numeric_limits<int>::min(),
                                          std::numeric_limits<int>::max()));
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  return json_to_bounded(value, key, std::numeric_limits<std::int64_t>::min(),
                         std::numeric_limits<std::int64_t>::max());
}

std::size_t json_to_size(const nlohmann::json& value, std::string_view key) {
  const auto v = json_to_int64(value, key);
  if (v < 0) {
    throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) + "'");
  }
  return static_cast<std::size_t>(v);
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_unsigned() && value.get<std::uint64_t>() <= 1) {
    return value.get<std::uint64_t>() == 1;
  }
  if (value.is_number_integer() && !value.is_number_unsigned()) {
    const auto v = value.get<std::int64_t>();
    if (v == 0 || v == 1) {
      return v == 1;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

Timestamp json_to_timestamp(const nlohmann::json& value, std::string_view key) {
  return from_epoch_ms(json_to_int64(value, key));
}

nlohmann::json strings_to_json(const std::vector<std::string>& values) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& v : values) {
    out.push_back(v);
  }
  return out;
}

nlohmann::json to_json(const LearningProfile& profile, ScenarioType scenario) {
  nlohmann::json out = nlohmann::json::object();
  out["scenario"] = to_string(scenario);
  out["alpha"] = profile.alpha;
  out["beta"] = profile.beta;
  out["attempt_count"] = profile.attempt_count;
  return out;
}

LearningProfile profile_from_json(const nlohmann::json& obj) {
  require_object(obj, "profile");
  LearningProfile profile;
  assign_if_present(obj, "alpha", [&](const nlohmann::json& v) { profile.alpha = json_to_double(v, "alpha"); });
  assign_if_present(obj, "beta", [&](const nlohmann::json& v) { profile.beta = json_to_double(v, "beta"); });
  assign_if_present(obj, "attempt_count", [&](const nlohmann::json& v) {
    profile.attempt_count = json_to_size(v, "attempt_count");
  });
  if (!std::isfinite(profile.alpha) || !std::isfinite(profile.beta) || profile.alpha < 1.0 ||
      profile.beta < 1.0) {
    throw std::invalid_argument("Profile alpha and beta must be finite and >= 1");
  }
  return profile;
}

nlohmann::json to_json(const SkillMemoryState& state, ScenarioType scenario) {
  nlohmann::json out = nlohmann::json::object();
  out["scenario"] = to_string(scenario);
  out["easiness_factor"] = state.easiness_factor;
  out["interval_days"] = state.interval_days;
  out["repetitions"] = state.repetitions;
  out["last_review_ms"] = to_epoch_ms(state.last_review);
  out["next_due_ms"] = to_epoch_ms(state.next_due);
  return out;
}

SkillMemoryState memory_from_json(const nlohmann::json& obj) {
  require_object(obj, "memory state");
  SkillMemoryState state;
  state.easiness_factor = json_to_double(require_field(obj, "easiness_factor"), "easiness_factor");
  state.interval_days = json_to_double(require_field(obj, "interval_days"), "interval_days");
  state.repetitions = json_to_int(require_field(obj, "repetitions"), "repetitions");
  state.last_review = json_to_timestamp(require_field(obj, "last_review_ms"), "last_review_ms");
  state.next_due = json_to_timestamp(require_field(obj, "next_due_ms"), "next_due_ms");
  if (!(state.easiness_factor >= MemoryScheduler::kMinEasiness) ||
      !(state.interval_days >= MemoryScheduler::kMinIntervalDays) || state.repetitions < 0) {
    throw std::invalid_argument("Memory state out of range");
  }
  return state;
}

} // namespace

nlohmann::json score_to_json(const Score& score) {
  if (auto value = score_value(score)) {
    return *value;
  }
  return nullptr;
}

ScenarioType scenario_from_json(const nlohmann::json& value) {
  if (value.is_string()) {
    return scenario_from_string(value.get<std::string>());
  }
  if (value.is_number_integer()) {
    const auto id = value.get<std::int64_t>();
    if (id < 0 || id >= static_cast<std::int64_t>(kScenarioCount)) {
      throw std::invalid_argument("Unknown scenario id: " + std::to_string(id));
    }
    return static_cast<ScenarioType>(id);
  }
  throw std::invalid_argument("Expected scenario name or id for field 'scenario'");
}

nlohmann::json to_json(const AttemptRecord& attempt) {
  nlohmann::json out = nlohmann::json::object();
  out["user_id"] = attempt.user_id;
  out["scenario"] = to_string(attempt.scenario);
  out["success"] = attempt.success;
  out["reaction_time"] = attempt.reaction_time;
  out["difficulty_level"] = attempt.difficulty_level;
  out["noise_level"] = attempt.noise_level;
  out["timestamp_ms"] = to_epoch_ms(attempt.timestamp);
  return out;
}

AttemptRecord attempt_from_json(const nlohmann::json& json_attempt, Timestamp fallback) {
  require_object(json_attempt, "attempt");
  AttemptRecord attempt;
  attempt.timestamp = fallback;
  attempt.user_id = json_to_string(require_field(json_attempt, "user_id"), "user_id");
  attempt.scenario = scenario_from_json(require_field(json_attempt, "scenario"));
  attempt.success = json_to_bool(require_field(json_attempt, "success"), "success");
  assign_if_present(json_attempt, "reaction_time", [&](const nlohmann::json& v) {
    attempt.reaction_time = json_to_double(v, "reaction_time");
  });
  assign_if_present(json_attempt, "difficulty_level", [&](const nlohmann::json& v) {
    attempt.difficulty_level = json_to_int(v, "difficulty_level");
  });
  assign_if_present(json_attempt, "noise_level", [&](const nlohmann::json& v) {
    attempt.noise_level = json_to_double(v, "noise_level");
  });
  assign_if_present(json_attempt, "timestamp_ms", [&](const nlohmann::json& v) {
    attempt.timestamp = json_to_timestamp(v, "timestamp_ms");
  });
  return attempt;
}

nlohmann::json to_json(const UserState& state) {
  nlohmann::json out = nlohmann::json::object();

  nlohmann::json profiles = nlohmann::json::array();
  nlohmann::json memory = nlohmann::json::array();
  for (ScenarioType scenario : kAllScenarios) {
    const auto idx = scenario_index(scenario);
    profiles.push_back(to_json(state.profiles[idx], scenario));
    if (state.memory[idx].has_value()) {
      memory.push_back(to_json(*state.memory[idx], scenario));
    }
  }
  out["profiles"] = profiles;
  out["memory"] = memory;

  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : state.window.entries()) {
    nlohmann::json item = nlohmann::json::object();
    item["reaction_time"] = entry.reaction_time;
    item["success"] = entry.success;
    item["timestamp_ms"] = to_epoch_ms(entry.timestamp);
    entries.push_back(item);
  }
  out["window"] = entries;

  nlohmann::json history = nlohmann::json::array();
  for (std::size_t i = 0; i < state.history.size(); ++i) {
    history.push_back(to_json(state.history[i]));
  }
  out["history"] = history;
  return out;
}

UserState user_state_from_json(const nlohmann::json& json_state, std::size_t window_capacity) {
  require_object(json_state, "user state");
  UserState state{ProfileSet{}, MemorySet{}, SessionWindow(window_capacity), {}};

  assign_if_present(json_state, "profiles", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array for field 'profiles'");
    }
    for (const auto& item : v) {
      require_object(item, "profile");
      const auto scenario = scenario_from_json(require_field(item, "scenario"));
      state.profiles[scenario_index(scenario)] = profile_from_json(item);
    }
  });

  assign_if_present(json_state, "memory", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array for field 'memory'");
    }
    for (const auto& item : v) {
      require_object(item, "memory state");
      const auto scenario = scenario_from_json(require_field(item, "scenario"));
      state.memory[scenario_index(scenario)] = memory_from_json(item);
    }
  });

  assign_if_present(json_state, "window", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array for field 'window'");
    }
    for (const auto& item : v) {
      require_object(item, "window entry");
      WindowEntry entry;
      entry.reaction_time = json_to_double(require_field(item, "reaction_time"), "reaction_time");
      entry.success = json_to_bool(require_field(item, "success"), "success");
      entry.timestamp = json_to_timestamp(require_field(item, "timestamp_ms"), "timestamp_ms");
      if (!std::isfinite(entry.reaction_time) || entry.reaction_time < 0.0) {
        throw std::invalid_argument("Window reaction_time must be finite and >= 0");
      }
      state.window.push(entry);
    }
  });

  assign_if_present(json_state, "history", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array for field 'history'");
    }
    for (const auto& item : v) {
      auto attempt = attempt_from_json(item, Timestamp{});
      validate_attempt(attempt);
      state.history.push_back(std::move(attempt));
    }
  });
  return state;
}

nlohmann::json to_json(const Recommendation& recommendation) {
  nlohmann::json out = nlohmann::json::object();
  out["scenario"] = to_string(recommendation.scenario);
  out["action"] = recommendation.action;
  out["visual_cue"] = recommendation.visual_cue;
  out["difficulty_level"] = recommendation.difficulty_level;
  out["noise_level"] = recommendation.noise_level;
  out["speed_modifier"] = recommendation.speed_modifier;
  out["reason"] = recommendation.reason;
  out["cognitive_load"] = recommendation.cognitive_load;
  out["in_flow_state"] = recommendation.in_flow_state;
  out["adaptive_signal"] = to_string(recommendation.adaptive_signal);
  out["intervention"] = to_string(recommendation.intervention);
  return out;
}

nlohmann::json to_json(const CognitiveLoad& load) {
  nlohmann::json out = nlohmann::json::object();
  out["value"] = load.value;
  out["level"] = to_string(load.level);
  out["intervention"] = to_string(load.intervention);
  out["sufficient_data"] = load.sufficient_data;
  nlohmann::json components = nlohmann::json::object();
  components["rt_variance"] = load.components.rt_variance;
  components["rt_trend"] = load.components.rt_trend;
  components["error_rate"] = load.components.error_rate;
  components["error_clustering"] = load.components.error_clustering;
  out["components"] = components;
  return out;
}

nlohmann::json to_json(const FlowAssessment& flow) {
  nlohmann::json out = nlohmann::json::object();
  out["in_flow"] = flow.in_flow;
  out["signal"] = to_string(flow.signal);
  out["reason"] = flow.reason;
  out["success_rate"] = flow.success_rate;
  if (flow.rt_cv.has_value()) {
    out["rt_cv"] = *flow.rt_cv;
  } else {
    out["rt_cv"] = nullptr;
  }
  out["consistency_score"] = flow.consistency_score;
  out["longest_failure_run"] = flow.longest_failure_run;
  return out;
}

nlohmann::json to_json(const CognitiveStatus& status) {
  nlohmann::json out = nlohmann::json::object();
  out["cognitive_load"] = status.cognitive_load;
  out["load_level"] = to_string(status.load_level);
  out["flow_state"] = to_json(status.flow_state);
  out["recommendation"] = status.recommendation;
  return out;
}

nlohmann::json to_json(const ClinicalResult& result) {
  nlohmann::json out = nlohmann::json::object();
  if (const auto* missing = std::get_if<InsufficientData>(&result)) {
    out["status"] = "insufficient_data";
    out["attempt_count"] = missing->attempt_count;
    out["required_attempts"] = missing->required_attempts;
    return out;
  }
  const auto& assessment = std::get<ClinicalAssessment>(result);
  out["status"] = "ok";
  out["figure_ground"] = score_to_json(assessment.figure_ground);
  out["temporal_processing"] = score_to_json(assessment.temporal_processing);
  out["localization"] = score_to_json(assessment.localization);
  out["attention_span_seconds"] = score_to_json(assessment.attention_span_seconds);
  out["attention_span_censored"] = assessment.attention_span_censored;
  out["composite"] = score_to_json(assessment.composite);
  if (assessment.interpretation.has_value()) {
    out["interpretation"] = to_string(*assessment.interpretation);
  } else {
    out["interpretation"] = nullptr;
  }
  out["strengths"] = strings_to_json(assessment.strengths);
  out["improvement_areas"] = strings_to_json(assessment.improvement_areas);
  out["attempt_count"] = assessment.attempt_count;
  out["computed_at_ms"] = to_epoch_ms(assessment.computed_at);
  return out;
}

nlohmann::json to_json(const ClinicalRecommendation& recommendation) {
  nlohmann::json out = nlohmann::json::object();
  out["area"] = recommendation.area;
  out["severity"] = recommendation.severity;
  out["suggestion"] = recommendation.suggestion;
  out["clinical_note"] = recommendation.clinical_note;
  return out;
}

nlohmann::json to_json(const std::vector<LearningCurvePoint>& curve) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& point : curve) {
    nlohmann::json item = nlohmann::json::object();
    item["attempt_index"] = point.attempt_index;
    item["moving_average_success"] = point.moving_average_success;
    item["success"] = point.success;
    item["difficulty_level"] = point.difficulty_level;
    item["scenario"] = to_string(point.scenario);
    item["timestamp_ms"] = to_epoch_ms(point.timestamp);
    out.push_back(item);
  }
  return out;
}

nlohmann::json to_json(const ProgressReport& report) {
  nlohmann::json out = nlohmann::json::object();
  out["total_attempts"] = report.total_attempts;
  out["success_rate"] = report.success_rate;
  out["avg_reaction_time"] = report.avg_reaction_time;
  out["improvement_rate"] = report.improvement_rate;

  nlohmann::json scenarios = nlohmann::json::object();
  for (const auto& breakdown : report.scenarios) {
    nlohmann::json item = nlohmann::json::object();
    item["attempts"] = breakdown.attempts;
    item["success_rate"] = breakdown.success_rate;
    item["avg_reaction_time"] = breakdown.avg_reaction_time;
    scenarios[to_string(breakdown.scenario)] = item;
  }
  out["scenario_breakdown"] = scenarios;
  out["current_state"] = to_json(report.current_state);

  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto& rec : report.recommendations) {
    recommendations.push_back(to_json(rec));
  }
  out["recommendations"] = recommendations;
  out["next_steps"] = strings_to_json(report.next_steps);
  out["generated_at_ms"] = to_epoch_ms(report.generated_at);
  return out;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json out = nlohmann::json::object();
  out["window_size"] = config.window_size;
  out["learning_curve_window"] = config.learning_curve_window;
  out["clinical_min_attempts"] = config.clinical_min_attempts;
  out["max_difficulty"] = config.max_difficulty;
  out["max_noise"] = config.max_noise;
  out["seed"] = config.seed;
  return out;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  EngineConfig config;
  if (json_config.is_null()) {
    return config;
  }
  require_object(json_config, "engine config");
  assign_if_present(json_config, "window_size", [&](const nlohmann::json& v) {
    config.window_size = json_to_size(v, "window_size");
  });
  assign_if_present(json_config, "learning_curve_window", [&](const nlohmann::json& v) {
    config.learning_curve_window = json_to_size(v, "learning_curve_window");
  });
  assign_if_present(json_config, "clinical_min_attempts", [&](const nlohmann::json& v) {
    config.clinical_min_attempts = json_to_size(v, "clinical_min_attempts");
  });
  assign_if_present(json_config, "max_difficulty", [&](const nlohmann::json& v) {
    config.max_difficulty = json_to_int(v, "max_difficulty");
  });
  assign_if_present(json_config, "max_noise", [&](const nlohmann::json& v) {
    config.max_noise = json_to_double(v, "max_noise");
  });
  assign_if_present(json_config, "seed", [&](const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
      config.seed = v.get<std::uint64_t>();
    } else if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
      config.seed = static_cast<std::uint64_t>(v.get<std::int64_t>());
    } else {
      throw std::invalid_argument("Expected non-negative integer for field 'seed'");
    }
  });
  config.validate();
  return config;
}

} // namespace hero::bridge
