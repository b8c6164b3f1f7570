#pragma once

#include "hero/engine_config.hpp"
#include "hero/state_store.hpp"
#include "hero/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace hero::bridge {

// Timestamps travel as integer epoch milliseconds ("*_ms" keys), scenarios by
// name, undetermined scores as null.

nlohmann::json to_json(const AttemptRecord& attempt);
// A missing "timestamp_ms" takes `fallback`.
AttemptRecord attempt_from_json(const nlohmann::json& json_attempt, Timestamp fallback);

nlohmann::json to_json(const UserState& state);
UserState user_state_from_json(const nlohmann::json& json_state, std::size_t window_capacity);

nlohmann::json to_json(const Recommendation& recommendation);
nlohmann::json to_json(const CognitiveLoad& load);
nlohmann::json to_json(const FlowAssessment& flow);
nlohmann::json to_json(const CognitiveStatus& status);
nlohmann::json to_json(const ClinicalResult& result);
nlohmann::json to_json(const ClinicalRecommendation& recommendation);
nlohmann::json to_json(const std::vector<LearningCurvePoint>& curve);
nlohmann::json to_json(const ProgressReport& report);

nlohmann::json to_json(const EngineConfig& config);
// Fields absent from the object keep their defaults; the clock is not serializable.
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

nlohmann::json score_to_json(const Score& score);
ScenarioType scenario_from_json(const nlohmann::json& value);

} // namespace hero::bridge
