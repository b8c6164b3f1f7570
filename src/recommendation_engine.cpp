#include "hero/recommendation_engine.hpp"

#include "../scoring/clinical_scoring.hpp"
#include "debug_log.hpp"
#include "hero/bandit_selector.hpp"
#include "hero/cognitive_load.hpp"
#include "hero/flow_detector.hpp"
#include "hero/memory_scheduler.hpp"
#include "hero/session_window.hpp"
#include "json_bridge.hpp"
#include "rng.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace hero {
namespace {

constexpr double kCorrectWeight = 0.5;
constexpr double kSpeedWeight = 0.2;
constexpr double kImprovementWeight = 0.3;
constexpr std::size_t kBaselineAttempts = 10;
constexpr std::size_t kMinBaselineAttempts = 3;
constexpr double kNeutralBaseline = 0.5;
constexpr double kFastRt = 1.0;
constexpr double kSlowRt = 5.0;

constexpr int kMinDifficulty = 1;
constexpr double kDefaultNoise = 0.2;
constexpr double kMinNoise = 0.0;
constexpr double kMinSpeed = 0.5;
constexpr double kMaxSpeed = 2.0;
constexpr double kSpeedPerLevel = 0.1;
constexpr double kNoiseStep = 0.1;
constexpr double kSpeedStep = 0.1;

double response_score(double reaction_time) {
  const double scaled = 1.0 - (reaction_time - kFastRt) / (2.0 * (kSlowRt - kFastRt));
  return detail::clip01(scaled);
}

double round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

std::uint64_t hash_user(const std::string& user_id) {
  std::uint64_t hash = 1469598103934665603ULL;  // FNV-1a
  for (unsigned char c : user_id) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

// Immutable snapshot published to readers.
struct Published {
  UserState state;
  std::uint64_t version = 0;
};

struct ClinicalCache {
  std::uint64_t version = 0;
  ClinicalAssessment assessment;
};

struct UserSlot {
  std::mutex write_mutex;
  std::shared_ptr<const Published> snapshot;  // std::atomic_load / std::atomic_store only
  std::atomic<std::uint64_t> draws{0};
  std::mutex cache_mutex;
  std::optional<ClinicalCache> clinical;
};

class RecommendationEngineImpl : public RecommendationEngine {
public:
  RecommendationEngineImpl(std::shared_ptr<StateStore> store, EngineConfig config)
      : store_(std::move(store)), config_(std::move(config)), scorer_(clinical_config(config_)) {
    if (!store_) {
      throw std::invalid_argument("RecommendationEngine requires a state store");
    }
    config_.validate();
    auto fresh = std::make_shared<Published>();
    fresh->state.window = SessionWindow(config_.window_size);
    fresh_ = std::move(fresh);
  }

  void record_attempt(const AttemptRecord& attempt) override {
    validate_attempt(attempt);
    validate_levels(attempt);
    auto slot = slot_for(attempt.user_id);
    std::scoped_lock guard(slot->write_mutex);
    const auto current = current_locked(*slot, attempt.user_id);

    auto next = std::make_shared<Published>(*current);
    next->version = current->version + 1;
    apply_attempt(next->state, attempt);

    // A failing store leaves the published snapshot untouched.
    store_->save(attempt.user_id, next->state);
    std::atomic_store(&slot->snapshot, std::shared_ptr<const Published>(std::move(next)));
    invalidate_clinical(*slot);

    if (detail::debug_enabled()) {
      std::ostringstream oss;
      oss << "record user=" << attempt.user_id << " scenario=" << to_string(attempt.scenario)
          << " success=" << attempt.success << " rt=" << attempt.reaction_time
          << " version=" << current->version + 1;
      detail::debug_log("engine", oss.str());
    }
  }

  Recommendation get_recommendation(const std::string& user_id) override {
    return get_recommendation(user_id, config_.now());
  }

  Recommendation get_recommendation(const std::string& user_id, Timestamp now) override {
    require_user(user_id);
    const auto view = read_view(user_id);
    const UserState& state = view.snapshot->state;

    const auto stats = summarize(state.window);
    const auto load = load_estimator_.estimate(stats);
    const auto flow = flow_detector_.assess(stats);

    Recommendation rec;
    const auto due = scheduler_.due_scenarios(state.memory, now);
    if (!due.empty()) {
      rec.scenario = due.front();
      rec.reason = "scheduled_review";
    } else {
      auto& draws = view.slot ? view.slot->draws : unknown_user_draws_;
      std::uint64_t rng_state = mix_seed(config_.seed ^ hash_user(user_id), draws.fetch_add(1));
      const std::vector<ScenarioType> candidates(kAllScenarios.begin(), kAllScenarios.end());
      const auto draw = bandit_.select(state.profiles, candidates, rng_state);
      rec.scenario = draw.scenario;
      rec.reason = "exploration_exploitation";
    }

    const auto cue = scenario_cue(rec.scenario);
    rec.action = cue.action;
    rec.visual_cue = cue.visual_cue;
    rec.cognitive_load = load.value;
    rec.in_flow_state = flow.in_flow;
    rec.adaptive_signal = flow.signal;
    rec.intervention = load.intervention;
    derive_levels(state, load.intervention, flow.signal, rec);

    if (detail::debug_enabled()) {
      std::ostringstream oss;
      oss << "recommend user=" << user_id << " scenario=" << to_string(rec.scenario)
          << " reason=" << rec.reason << " difficulty=" << rec.difficulty_level
          << " noise=" << rec.noise_level << " load=" << load.value
          << " signal=" << to_string(flow.signal);
      detail::debug_log("engine", oss.str());
    }
    return rec;
  }

  CognitiveStatus get_cognitive_status(const std::string& user_id) override {
    require_user(user_id);
    return cognitive_status(read_view(user_id).snapshot->state);
  }

  ClinicalResult get_clinical_assessment(const std::string& user_id) override {
    require_user(user_id);
    const auto view = read_view(user_id);
    const auto& slot = view.slot;
    const auto& snapshot = view.snapshot;
    if (slot) {
      std::scoped_lock guard(slot->cache_mutex);
      if (slot->clinical.has_value() && slot->clinical->version == snapshot->version) {
        return slot->clinical->assessment;
      }
    }

    auto result = scorer_.assess(snapshot->state.history.to_vector(), config_.now());
    const auto* assessment = std::get_if<ClinicalAssessment>(&result);
    if (slot && assessment) {
      std::scoped_lock guard(slot->cache_mutex);
      if (!slot->clinical.has_value() || slot->clinical->version < snapshot->version) {
        slot->clinical = ClinicalCache{snapshot->version, *assessment};
      }
    }
    return result;
  }

  std::vector<ClinicalRecommendation> get_clinical_recommendations(
      const std::string& user_id) override {
    require_user(user_id);
    const auto snapshot = read_view(user_id).snapshot;
    const auto load = load_estimator_.estimate(snapshot->state.window);
    return scorer_.recommendations(snapshot->state.history.to_vector(), load.value);
  }

  std::vector<LearningCurvePoint> get_learning_curve(const std::string& user_id) override {
    require_user(user_id);
    const auto snapshot = read_view(user_id).snapshot;
    const auto ordered = scoring::sorted_by_time(snapshot->state.history.to_vector());

    std::vector<LearningCurvePoint> curve;
    curve.reserve(ordered.size());
    const std::size_t window = config_.learning_curve_window;
    std::size_t successes = 0;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
      if (ordered[i].success) ++successes;
      if (i >= window && ordered[i - window].success) --successes;
      const std::size_t span = std::min(i + 1, window);

      LearningCurvePoint point;
      point.attempt_index = i + 1;
      point.moving_average_success = static_cast<double>(successes) / static_cast<double>(span);
      point.success = ordered[i].success;
      point.difficulty_level = ordered[i].difficulty_level;
      point.scenario = ordered[i].scenario;
      point.timestamp = ordered[i].timestamp;
      curve.push_back(point);
    }
    return curve;
  }

  ProgressReport get_progress_report(const std::string& user_id, Timestamp since) override {
    require_user(user_id);
    const auto snapshot = read_view(user_id).snapshot;
    const auto status = cognitive_status(snapshot->state);
    auto report = scorer_.progress_report(snapshot->state.history.to_vector(), since,
                                          status.cognitive_load, config_.now());
    report.current_state = status;
    report.next_steps = scoring::ClinicalScorer::next_steps(report);
    return report;
  }

  UserState export_user(const std::string& user_id) override {
    require_user(user_id);
    return read_view(user_id).snapshot->state;
  }

  void import_user(const std::string& user_id, const UserState& state) override {
    require_user(user_id);
    for (std::size_t i = 0; i < state.history.size(); ++i) {
      const auto& attempt = state.history[i];
      validate_attempt(attempt);
      validate_levels(attempt);
      if (attempt.user_id != user_id) {
        throw std::invalid_argument("Imported history belongs to user '" + attempt.user_id + "'");
      }
    }
    auto slot = slot_for(user_id);
    std::scoped_lock guard(slot->write_mutex);
    const auto current = std::atomic_load(&slot->snapshot);

    auto next = std::make_shared<Published>();
    next->state = conform_window(state);
    next->version = current ? current->version + 1 : 1;
    store_->save(user_id, next->state);
    std::atomic_store(&slot->snapshot, std::shared_ptr<const Published>(std::move(next)));
    invalidate_clinical(*slot);
    detail::debug_log("engine", "import user=" + user_id);
  }

  nlohmann::json debug_state(const std::string& user_id) override {
    require_user(user_id);
    const auto view = read_view(user_id);
    const auto& slot = view.slot;
    const auto& snapshot = view.snapshot;
    const UserState& state = snapshot->state;

    nlohmann::json info = nlohmann::json::object();
    info["user_id"] = user_id;
    info["version"] = snapshot->version;
    info["attempt_count"] = state.history.size();
    info["recommendation_draws"] = slot ? slot->draws.load() : 0;

    nlohmann::json arms = nlohmann::json::object();
    for (ScenarioType scenario : kAllScenarios) {
      const auto& profile = state.profiles[scenario_index(scenario)];
      nlohmann::json arm = nlohmann::json::object();
      arm["alpha"] = profile.alpha;
      arm["beta"] = profile.beta;
      arm["attempt_count"] = profile.attempt_count;
      arm["expected_value"] = BanditSelector::expected_value(profile);
      const auto& memory = state.memory[scenario_index(scenario)];
      if (memory.has_value()) {
        arm["memory_strength"] = MemoryScheduler::memory_strength(*memory, config_.now());
        arm["next_due_ms"] = to_epoch_ms(memory->next_due);
      } else {
        arm["memory_strength"] = nullptr;
        arm["next_due_ms"] = nullptr;
      }
      arms[to_string(scenario)] = arm;
    }
    info["scenarios"] = arms;
    info["cognitive_load"] = bridge::to_json(load_estimator_.estimate(state.window));
    info["flow_state"] = bridge::to_json(flow_detector_.assess(state.window));
    info["window_size"] = state.window.size();
    info["window_capacity"] = state.window.capacity();
    info["clinical_cached"] = false;
    if (slot) {
      std::scoped_lock guard(slot->cache_mutex);
      info["clinical_cached"] =
          slot->clinical.has_value() && slot->clinical->version == snapshot->version;
    }
    return info;
  }

  const EngineConfig& config() const override { return config_; }

private:
  static scoring::ClinicalScoringConfig clinical_config(const EngineConfig& config) {
    scoring::ClinicalScoringConfig clinical;
    clinical.min_attempts = config.clinical_min_attempts;
    return clinical;
  }

  static void require_user(const std::string& user_id) {
    if (user_id.empty()) {
      throw std::invalid_argument("user_id must not be empty");
    }
  }

  // Attempts outside the engine's level ranges would force derive_levels to
  // jump more than one step back into range.
  void validate_levels(const AttemptRecord& attempt) const {
    if (attempt.difficulty_level > config_.max_difficulty) {
      throw std::invalid_argument("difficulty_level " + std::to_string(attempt.difficulty_level) +
                                  " exceeds max_difficulty " +
                                  std::to_string(config_.max_difficulty));
    }
    if (attempt.noise_level > config_.max_noise) {
      std::ostringstream oss;
      oss << "noise_level " << attempt.noise_level << " exceeds max_noise " << config_.max_noise;
      throw std::invalid_argument(oss.str());
    }
  }

  struct ReadView {
    std::shared_ptr<UserSlot> slot;  // null for a user neither tracked nor stored
    std::shared_ptr<const Published> snapshot;
  };

  // Reads never register a slot for a user the store does not know.
  ReadView read_view(const std::string& user_id) {
    if (auto slot = find_slot(user_id)) {
      return {slot, snapshot_for(*slot, user_id)};
    }
    auto stored = store_->load(user_id);
    if (!stored) {
      return {nullptr, fresh_};
    }
    auto slot = slot_for(user_id);
    std::scoped_lock guard(slot->write_mutex);
    auto current = std::atomic_load(&slot->snapshot);
    if (!current) {
      auto loaded = std::make_shared<Published>();
      loaded->state = conform_window(*stored);
      current = std::shared_ptr<const Published>(std::move(loaded));
      std::atomic_store(&slot->snapshot, current);
      detail::debug_log("engine", "loaded user=" + user_id);
    }
    return {slot, current};
  }

  std::shared_ptr<UserSlot> find_slot(const std::string& user_id) {
    std::scoped_lock guard(registry_mutex_);
    const auto it = users_.find(user_id);
    if (it == users_.end()) {
      return nullptr;
    }
    return it->second;
  }

  std::shared_ptr<UserSlot> slot_for(const std::string& user_id) {
    std::scoped_lock guard(registry_mutex_);
    auto& slot = users_[user_id];
    if (!slot) {
      slot = std::make_shared<UserSlot>();
    }
    return slot;
  }

  // Caller holds slot.write_mutex.
  std::shared_ptr<const Published> current_locked(UserSlot& slot, const std::string& user_id) {
    auto current = std::atomic_load(&slot.snapshot);
    if (current) {
      return current;
    }
    auto loaded = std::make_shared<Published>();
    if (auto stored = store_->load(user_id)) {
      loaded->state = conform_window(*stored);
      detail::debug_log("engine", "loaded user=" + user_id);
    } else {
      loaded->state.window = SessionWindow(config_.window_size);
    }
    current = std::shared_ptr<const Published>(std::move(loaded));
    std::atomic_store(&slot.snapshot, current);
    return current;
  }

  std::shared_ptr<const Published> snapshot_for(UserSlot& slot, const std::string& user_id) {
    if (auto current = std::atomic_load(&slot.snapshot)) {
      return current;
    }
    std::scoped_lock guard(slot.write_mutex);
    return current_locked(slot, user_id);
  }

  UserState conform_window(const UserState& state) const {
    UserState out = state;
    if (out.window.capacity() != config_.window_size) {
      SessionWindow resized(config_.window_size);
      for (const auto& entry : state.window.entries()) {
        resized.push(entry);
      }
      out.window = std::move(resized);
    }
    return out;
  }

  static void invalidate_clinical(UserSlot& slot) {
    std::scoped_lock guard(slot.cache_mutex);
    slot.clinical.reset();
  }

  void apply_attempt(UserState& state, const AttemptRecord& attempt) const {
    const auto idx = scenario_index(attempt.scenario);
    const double gain = learning_gain(state.history, attempt);
    const int quality = MemoryScheduler::quality(attempt.reaction_time, attempt.success);

    bandit_.update(state.profiles[idx], gain);

    auto& memory = state.memory[idx];
    if (!memory.has_value()) {
      memory = MemoryScheduler::initial_state(attempt.timestamp);
    }
    scheduler_.update(*memory, quality, attempt.timestamp);

    state.window.push(WindowEntry{attempt.reaction_time, attempt.success, attempt.timestamp});
    state.history.push_back(attempt);
  }

  CognitiveStatus cognitive_status(const UserState& state) const {
    const auto stats = summarize(state.window);
    const auto load = load_estimator_.estimate(stats);
    CognitiveStatus status;
    status.cognitive_load = load.value;
    status.load_level = load.level;
    status.flow_state = flow_detector_.assess(stats);
    status.recommendation = cognitive_status_text(load, status.flow_state);
    return status;
  }

  // Starts from the last recorded attempt and moves each knob at most one step.
  void derive_levels(const UserState& state, Intervention intervention, AdaptiveSignal signal,
                     Recommendation& rec) const {
    int difficulty = kMinDifficulty;
    double noise = kDefaultNoise;
    if (!state.history.empty()) {
      difficulty = state.history.back().difficulty_level;
      noise = state.history.back().noise_level;
    }
    difficulty = std::clamp(difficulty, kMinDifficulty, config_.max_difficulty);
    noise = std::clamp(noise, kMinNoise, config_.max_noise);
    double speed = std::clamp(1.0 + (difficulty - 1) * kSpeedPerLevel, kMinSpeed, kMaxSpeed);

    const bool strained = intervention != Intervention::None;
    const bool raise = signal == AdaptiveSignal::IncreaseDifficulty && !strained;
    const bool lower = signal == AdaptiveSignal::DecreaseDifficulty;

    if (raise) {
      difficulty += 1;
    } else if (lower) {
      difficulty -= 1;
    }

    if (strained || lower) {
      noise -= kNoiseStep;
    } else if (raise) {
      noise += kNoiseStep;
    }

    if (lower || intervention == Intervention::SuggestBreak) {
      speed -= kSpeedStep;
    } else if (raise) {
      speed += kSpeedStep;
    }

    rec.difficulty_level = std::clamp(difficulty, kMinDifficulty, config_.max_difficulty);
    rec.noise_level = round2(std::clamp(noise, kMinNoise, config_.max_noise));
    rec.speed_modifier = round2(std::clamp(speed, kMinSpeed, kMaxSpeed));
  }

  std::shared_ptr<StateStore> store_;
  EngineConfig config_;
  BanditSelector bandit_;
  MemoryScheduler scheduler_;
  CognitiveLoadEstimator load_estimator_;
  FlowStateDetector flow_detector_;
  scoring::ClinicalScorer scorer_;

  std::shared_ptr<const Published> fresh_;
  std::atomic<std::uint64_t> unknown_user_draws_{0};

  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<UserSlot>> users_;
};

} // namespace

double learning_gain(const AttemptHistory& history, const AttemptRecord& attempt) {
  std::size_t seen = 0;
  std::size_t successes = 0;
  for (std::size_t i = history.size(); i > 0 && seen < kBaselineAttempts; --i) {
    const auto& past = history[i - 1];
    if (past.scenario != attempt.scenario) {
      continue;
    }
    ++seen;
    if (past.success) ++successes;
  }
  const double baseline = seen < kMinBaselineAttempts
                              ? kNeutralBaseline
                              : static_cast<double>(successes) / static_cast<double>(seen);

  if (!attempt.success) {
    return 0.0;
  }
  const double speed = attempt.reaction_time > 0.0 ? response_score(attempt.reaction_time)
                                                   : kNeutralBaseline;
  const double improvement = 1.0 - baseline;
  return detail::clip01(kCorrectWeight + kSpeedWeight * speed + kImprovementWeight * improvement);
}

std::string cognitive_status_text(const CognitiveLoad& load, const FlowAssessment& flow) {
  if (CognitiveLoadEstimator::intervention_for(load.value) == Intervention::SuggestBreak) {
    return "Take a break - cognitive load is high";
  }
  if (flow.in_flow) {
    return "Optimal learning state - continue";
  }
  if (flow.signal == AdaptiveSignal::DecreaseDifficulty) {
    return "Reduce difficulty temporarily";
  }
  if (flow.signal == AdaptiveSignal::IncreaseDifficulty) {
    return "Ready for more challenge";
  }
  return "Continue current approach";
}

std::unique_ptr<RecommendationEngine> make_engine(std::shared_ptr<StateStore> store,
                                                  EngineConfig config) {
  return std::make_unique<RecommendationEngineImpl>(std::move(store), std::move(config));
}

std::unique_ptr<RecommendationEngine> make_engine(EngineConfig config) {
  return make_engine(make_memory_store(), std::move(config));
}

} // namespace hero
