#pragma once

#include "engine_config.hpp"
#include "state_store.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace hero {

class RecommendationEngine {
public:
  virtual ~RecommendationEngine() = default;

  // Validates, then updates bandit, memory, window and history for the
  // attempt's user and persists through the store.
  virtual void record_attempt(const AttemptRecord& attempt) = 0;

  // Read-only: never changes the user's learning state.
  virtual Recommendation get_recommendation(const std::string& user_id) = 0;
  virtual Recommendation get_recommendation(const std::string& user_id, Timestamp now) = 0;

  virtual CognitiveStatus get_cognitive_status(const std::string& user_id) = 0;

  virtual ClinicalResult get_clinical_assessment(const std::string& user_id) = 0;

  virtual std::vector<ClinicalRecommendation> get_clinical_recommendations(
      const std::string& user_id) = 0;

  virtual std::vector<LearningCurvePoint> get_learning_curve(const std::string& user_id) = 0;

  virtual ProgressReport get_progress_report(const std::string& user_id, Timestamp since) = 0;

  virtual UserState export_user(const std::string& user_id) = 0;

  // Replaces the user's state wholesale and persists it.
  virtual void import_user(const std::string& user_id, const UserState& state) = 0;

  virtual nlohmann::json debug_state(const std::string& user_id) = 0;

  virtual const EngineConfig& config() const = 0;
};

std::unique_ptr<RecommendationEngine> make_engine(std::shared_ptr<StateStore> store,
                                                  EngineConfig config = {});

// Engine over a private in-memory store.
std::unique_ptr<RecommendationEngine> make_engine(EngineConfig config = {});

// Graded reward for the bandit: 0.5 correctness + 0.2 speed + 0.3 improvement
// over the scenario's recent baseline. `history` holds the attempts recorded
// before `attempt`.
double learning_gain(const AttemptHistory& history, const AttemptRecord& attempt);

// One-line advice shown with the cognitive status. Suggests a break exactly
// when the load estimator's intervention would.
std::string cognitive_status_text(const CognitiveLoad& load, const FlowAssessment& flow);

} // namespace hero
