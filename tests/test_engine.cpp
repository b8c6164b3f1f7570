#include "../include/hero/cognitive_load.hpp"
#include "../include/hero/recommendation_engine.hpp"
#include "../include/hero/state_store.hpp"
#include "../include/hero/types.hpp"

#include "../src/json_bridge.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

const hero::Timestamp kEpoch = hero::from_epoch_ms(1700000000000LL);

hero::Timestamp at_seconds(double seconds) {
  return kEpoch + std::chrono::duration_cast<hero::Clock::duration>(
                      std::chrono::duration<double>(seconds));
}

hero::EngineConfig fixed_config(std::uint64_t seed = 11) {
  hero::EngineConfig config;
  config.seed = seed;
  config.clock = [] { return at_seconds(3600.0); };
  return config;
}

hero::AttemptRecord make_attempt(const std::string& user, hero::ScenarioType scenario, bool success,
                                 double rt, int difficulty, double noise, hero::Timestamp ts) {
  hero::AttemptRecord attempt;
  attempt.user_id = user;
  attempt.scenario = scenario;
  attempt.success = success;
  attempt.reaction_time = rt;
  attempt.difficulty_level = difficulty;
  attempt.noise_level = noise;
  attempt.timestamp = ts;
  return attempt;
}

std::string state_digest(hero::RecommendationEngine& engine, const std::string& user) {
  return hero::bridge::to_json(engine.export_user(user)).dump();
}

class FlakyStore : public hero::StateStore {
public:
  std::optional<hero::UserState> load(const std::string& user_id) override {
    ++loads;
    if (fail_loads) {
      throw hero::StoreUnavailable("state store offline");
    }
    return inner_->load(user_id);
  }

  void save(const std::string& user_id, const hero::UserState& state) override {
    if (fail_saves) {
      throw hero::StoreUnavailable("state store offline");
    }
    inner_->save(user_id, state);
  }

  std::atomic<bool> fail_loads{false};
  std::atomic<bool> fail_saves{false};
  std::atomic<int> loads{0};

private:
  std::shared_ptr<hero::StateStore> inner_ = hero::make_memory_store();
};

void test_new_user(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  const auto rec = engine->get_recommendation("newcomer");
  suite.require(rec.reason == "exploration_exploitation", "New user is served by the bandit");
  suite.require(rec.difficulty_level == 1, "New user starts at difficulty 1");
  suite.require(std::abs(rec.noise_level - 0.2) < 1e-9, "New user starts at noise 0.2");
  suite.require(std::abs(rec.speed_modifier - 1.0) < 1e-9, "New user starts at speed 1.0");
  suite.require(!rec.action.empty() && !rec.visual_cue.empty(), "Recommendation carries its cue");
  suite.require(rec.cognitive_load == 0.5, "No data gives neutral load");

  const auto state = engine->export_user("newcomer");
  bool priors = true;
  for (const auto& profile : state.profiles) {
    priors = priors && profile.alpha == 1.0 && profile.beta == 1.0 && profile.attempt_count == 0;
  }
  for (const auto& memory : state.memory) {
    priors = priors && !memory.has_value();
  }
  suite.require(priors, "Recommending for a new user leaves default priors");
  suite.require(state.history.empty(), "New user has no history");
}

void test_recommend_is_read_only(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 6; ++i) {
    engine->record_attempt(make_attempt("reader", hero::kAllScenarios[i % 5], i % 3 != 0,
                                        1.0 + 0.2 * i, 2, 0.3, at_seconds(10.0 * i)));
  }
  const auto before = state_digest(*engine, "reader");
  engine->get_recommendation("reader");
  engine->get_recommendation("reader");
  engine->get_cognitive_status("reader");
  engine->get_clinical_assessment("reader");
  suite.require(state_digest(*engine, "reader") == before,
                "Reads leave profiles and memory states unchanged");
}

void test_invalid_attempts(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  engine->record_attempt(
      make_attempt("strict", hero::ScenarioType::Police, true, 1.0, 1, 0.2, kEpoch));
  const auto before = state_digest(*engine, "strict");

  std::vector<hero::AttemptRecord> bad;
  bad.push_back(make_attempt("strict", hero::ScenarioType::Police, true, -1.0, 1, 0.2, kEpoch));
  bad.push_back(make_attempt("strict", hero::ScenarioType::Police, true,
                             std::numeric_limits<double>::quiet_NaN(), 1, 0.2, kEpoch));
  bad.push_back(make_attempt("strict", hero::ScenarioType::Police, true, 1.0, 1, 1.5, kEpoch));
  bad.push_back(make_attempt("strict", hero::ScenarioType::Police, true, 1.0, 0, 0.2, kEpoch));
  bad.push_back(make_attempt("", hero::ScenarioType::Police, true, 1.0, 1, 0.2, kEpoch));
  bad.push_back(make_attempt("strict", static_cast<hero::ScenarioType>(9), true, 1.0, 1, 0.2, kEpoch));

  int rejected = 0;
  for (const auto& attempt : bad) {
    try {
      engine->record_attempt(attempt);
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
  }
  suite.require(rejected == static_cast<int>(bad.size()), "Every malformed attempt is rejected");
  suite.require(state_digest(*engine, "strict") == before, "Rejected attempts change nothing");

  bool unknown_name = false;
  try {
    hero::scenario_from_string("spaceship");
  } catch (const std::invalid_argument&) {
    unknown_name = true;
  }
  suite.require(unknown_name, "Unknown scenario names are rejected");
}

void test_record_updates_components(TestSuite& suite) {
  auto store = hero::make_memory_store();
  auto engine = hero::make_engine(store, fixed_config());
  engine->record_attempt(
      make_attempt("learner", hero::ScenarioType::Train, true, 1.0, 1, 0.2, kEpoch));
  engine->record_attempt(
      make_attempt("learner", hero::ScenarioType::Firetruck, false, 0.0, 1, 0.2, at_seconds(5)));

  const auto state = engine->export_user("learner");
  const auto& train = state.profiles[hero::scenario_index(hero::ScenarioType::Train)];
  const auto& fire = state.profiles[hero::scenario_index(hero::ScenarioType::Firetruck)];
  suite.require(train.alpha > 1.0 && train.beta == 1.0, "Success rewards the arm");
  suite.require(fire.alpha == 1.0 && fire.beta == 2.0, "Failure penalizes the arm by one");
  suite.require(state.memory[hero::scenario_index(hero::ScenarioType::Train)].has_value(),
                "First attempt creates the memory state");
  suite.require(!state.memory[hero::scenario_index(hero::ScenarioType::Police)].has_value(),
                "Untouched scenarios have no memory state");
  suite.require(state.window.size() == 2 && state.history.size() == 2,
                "Window and history receive the attempts");

  const auto persisted = store->load("learner");
  suite.require(persisted.has_value() && persisted->history.size() == 2,
                "Attempts are persisted through the store");

  auto reloaded = hero::make_engine(store, fixed_config());
  suite.require(reloaded->export_user("learner").history.size() == 2,
                "A new engine resumes from stored state");
}

void test_learning_gain(TestSuite& suite) {
  const auto fail = make_attempt("g", hero::ScenarioType::Ambulance, false, 1.0, 1, 0.0, kEpoch);
  suite.require(hero::learning_gain({}, fail) == 0.0, "Failure earns no gain");

  const auto fast = make_attempt("g", hero::ScenarioType::Ambulance, true, 1.0, 1, 0.0, kEpoch);
  suite.require(std::abs(hero::learning_gain({}, fast) - 0.85) < 1e-9,
                "Fast success on a fresh scenario earns 0.85");

  const hero::AttemptHistory mastered{fast, fast, fast, fast};
  suite.require(std::abs(hero::learning_gain(mastered, fast) - 0.7) < 1e-9,
                "Success on a mastered scenario earns no improvement credit");

  const auto slow = make_attempt("g", hero::ScenarioType::Ambulance, true, 9.0, 1, 0.0, kEpoch);
  suite.require(hero::learning_gain(mastered, slow) > hero::BanditSelector::kRewardThreshold,
                "Any success still rewards the arm");
}

void test_scheduled_review(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  engine->record_attempt(make_attempt("review", hero::ScenarioType::Train, true, 1.0, 1, 0.2, kEpoch));
  engine->record_attempt(
      make_attempt("review", hero::ScenarioType::IceCream, true, 1.0, 1, 0.2, at_seconds(600)));

  const auto early = engine->get_recommendation("review", at_seconds(3600.0));
  suite.require(early.reason == "exploration_exploitation", "Nothing is due after an hour");

  const auto later = engine->get_recommendation("review", at_seconds(2.0 * 86400.0));
  suite.require(later.reason == "scheduled_review", "Due reviews override the bandit");
  suite.require(later.scenario == hero::ScenarioType::Train, "The earliest due review wins");
}

void test_level_derivation(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 10; ++i) {
    engine->record_attempt(make_attempt("ace", hero::kAllScenarios[i % 5], true, 1.0, 3, 0.3,
                                        at_seconds(5.0 * i)));
  }
  const auto up = engine->get_recommendation("ace");
  suite.require(up.adaptive_signal == hero::AdaptiveSignal::IncreaseDifficulty,
                "Perfect window asks for more difficulty");
  suite.require(up.difficulty_level == 4, "Difficulty rises by one level");
  suite.require(std::abs(up.noise_level - 0.4) < 1e-9, "Noise rises by one step");
  suite.require(std::abs(up.speed_modifier - 1.3) < 1e-9, "Speed rises by one step");

  for (int i = 0; i < 10; ++i) {
    engine->record_attempt(make_attempt("stuck", hero::kAllScenarios[i % 5], false, 0.0, 3, 0.3,
                                        at_seconds(5.0 * i)));
  }
  const auto down = engine->get_recommendation("stuck");
  suite.require(down.adaptive_signal == hero::AdaptiveSignal::DecreaseDifficulty,
                "Failing window lowers difficulty");
  suite.require(down.difficulty_level == 2, "Difficulty falls by one level");
  suite.require(std::abs(down.noise_level - 0.2) < 1e-9, "Noise falls by one step");
  suite.require(std::abs(down.speed_modifier - 1.1) < 1e-9, "Speed falls by one step");

  for (int i = 0; i < 10; ++i) {
    engine->record_attempt(make_attempt("floor", hero::kAllScenarios[i % 5], false, 0.0, 1, 0.0,
                                        at_seconds(5.0 * i)));
  }
  const auto floor = engine->get_recommendation("floor");
  suite.require(floor.difficulty_level == 1 && floor.noise_level == 0.0,
                "Levels are clamped at their minimum");

  const auto status = engine->get_cognitive_status("stuck");
  suite.require(status.recommendation == "Reduce difficulty temporarily",
                "Cognitive status explains the adjustment");
}

void test_level_caps(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  engine->record_attempt(make_attempt("capped", hero::ScenarioType::Train, true, 1.0, 2, 0.3, kEpoch));
  const auto before = state_digest(*engine, "capped");

  int rejected = 0;
  for (const auto& attempt :
       {make_attempt("capped", hero::ScenarioType::Train, true, 1.0, 40, 0.3, at_seconds(5)),
        make_attempt("capped", hero::ScenarioType::Train, true, 1.0, 2, 1.0, at_seconds(5))}) {
    try {
      engine->record_attempt(attempt);
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
  }
  suite.require(rejected == 2, "Attempts above max_difficulty or max_noise are rejected");
  suite.require(state_digest(*engine, "capped") == before, "Out-of-range attempts change nothing");

  hero::UserState legacy;
  legacy.window = hero::SessionWindow(10);
  legacy.history.push_back(
      make_attempt("legacy", hero::ScenarioType::Train, true, 1.0, 40, 0.3, kEpoch));
  bool import_rejected = false;
  try {
    engine->import_user("legacy", legacy);
  } catch (const std::invalid_argument&) {
    import_rejected = true;
  }
  suite.require(import_rejected, "Imported history above the level caps is rejected");

  for (int i = 0; i < 10; ++i) {
    engine->record_attempt(make_attempt("top", hero::kAllScenarios[i % 5], false, 0.0, 10, 0.8,
                                        at_seconds(5.0 * i)));
  }
  const auto down = engine->get_recommendation("top");
  suite.require(down.difficulty_level == 9, "Difficulty leaves the cap by a single level");
  suite.require(std::abs(down.noise_level - 0.7) < 1e-9, "Noise leaves the cap by a single step");
}

void test_failing_store(TestSuite& suite) {
  auto store = std::make_shared<FlakyStore>();
  auto engine = hero::make_engine(store, fixed_config());
  engine->record_attempt(make_attempt("flaky", hero::ScenarioType::Police, true, 1.0, 1, 0.2, kEpoch));
  const auto before = state_digest(*engine, "flaky");

  store->fail_saves = true;
  bool retryable = false;
  try {
    engine->record_attempt(
        make_attempt("flaky", hero::ScenarioType::Police, false, 2.0, 1, 0.2, at_seconds(5)));
  } catch (const hero::StoreUnavailable& ex) {
    retryable = ex.retryable();
  }
  suite.require(retryable, "Save failure surfaces as a retryable StoreUnavailable");
  suite.require(state_digest(*engine, "flaky") == before, "Failed save leaves state unchanged");

  store->fail_saves = false;
  engine->record_attempt(
      make_attempt("flaky", hero::ScenarioType::Police, false, 2.0, 1, 0.2, at_seconds(5)));
  suite.require(engine->export_user("flaky").history.size() == 2, "Retry after recovery succeeds");

  store->fail_loads = true;
  auto cold = hero::make_engine(store, fixed_config());
  bool load_failed = false;
  try {
    cold->get_recommendation("flaky");
  } catch (const hero::StoreUnavailable&) {
    load_failed = true;
  }
  suite.require(load_failed, "Load failure propagates to the caller");
  store->fail_loads = false;
  suite.require(cold->export_user("flaky").history.size() == 2, "Load is retried on the next call");
}

void test_clinical_cache(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 5; ++i) {
    engine->record_attempt(
        make_attempt("clinic", hero::ScenarioType::Ambulance, true, 1.0, 1, 0.6, at_seconds(10.0 * i)));
  }
  const auto early = engine->get_clinical_assessment("clinic");
  const auto* missing = std::get_if<hero::InsufficientData>(&early);
  suite.require(missing != nullptr && missing->attempt_count == 5 && missing->required_attempts == 20,
                "Five attempts are insufficient");

  for (int i = 5; i < 20; ++i) {
    engine->record_attempt(
        make_attempt("clinic", hero::ScenarioType::Ambulance, i % 4 != 0, 1.0 + 0.1 * (i % 3), 1,
                     0.6, at_seconds(10.0 * i)));
  }
  const auto result = engine->get_clinical_assessment("clinic");
  const auto* assessment = std::get_if<hero::ClinicalAssessment>(&result);
  suite.require(assessment != nullptr, "Twenty attempts are assessed");
  if (assessment) {
    suite.require(hero::is_determined(assessment->figure_ground), "Noisy attempts score figure-ground");
    suite.require(assessment->attempt_count == 20, "Assessment counts the attempts");
  }
  suite.require(engine->debug_state("clinic")["clinical_cached"].get<bool>(),
                "Assessment is cached");

  engine->record_attempt(
      make_attempt("clinic", hero::ScenarioType::Police, true, 1.0, 1, 0.2, at_seconds(300)));
  suite.require(!engine->debug_state("clinic")["clinical_cached"].get<bool>(),
                "A new attempt invalidates the cache");
  const auto refreshed = engine->get_clinical_assessment("clinic");
  const auto* fresh = std::get_if<hero::ClinicalAssessment>(&refreshed);
  suite.require(fresh != nullptr && fresh->attempt_count == 21, "Recomputed after invalidation");
}

void test_learning_curve(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 12; ++i) {
    engine->record_attempt(make_attempt("curve", hero::ScenarioType::Police, i < 5, 1.5, 1, 0.2,
                                        at_seconds(10.0 * i)));
  }
  const auto curve = engine->get_learning_curve("curve");
  suite.require(curve.size() == 12, "One point per attempt");
  if (curve.size() == 12) {
    suite.require(curve.front().attempt_index == 1, "Indices are 1-based");
    suite.require(curve[4].moving_average_success == 1.0, "Early average covers the attempts so far");
    suite.require(std::abs(curve[11].moving_average_success - 0.3) < 1e-9,
                  "Average covers the last ten attempts");
  }
  suite.require(engine->get_learning_curve("curve").size() == curve.size(),
                "The curve can be requested again");
  suite.require(engine->get_learning_curve("nobody").empty(), "Unknown user has an empty curve");
}

void test_unknown_user_reads(TestSuite& suite) {
  auto store = std::make_shared<FlakyStore>();
  auto engine = hero::make_engine(store, fixed_config());

  engine->get_learning_curve("ghost");
  engine->get_recommendation("ghost");
  engine->get_cognitive_status("ghost");
  engine->get_clinical_assessment("ghost");
  suite.require(store->loads == 4, "Reads for an unknown user consult the store every time");
  suite.require(engine->debug_state("ghost")["version"] == 0, "Unknown user reads the default state");

  engine->record_attempt(make_attempt("ghost", hero::ScenarioType::Police, true, 1.0, 1, 0.2, kEpoch));
  const int after_write = store->loads;
  engine->get_recommendation("ghost");
  engine->get_learning_curve("ghost");
  suite.require(store->loads == after_write, "A recorded user is served from its snapshot");

  auto fresh = hero::make_engine(store, fixed_config());
  const int before_reads = store->loads;
  suite.require(fresh->get_learning_curve("ghost").size() == 1, "Stored users are loaded on read");
  fresh->get_recommendation("ghost");
  suite.require(store->loads == before_reads + 1, "A stored user is loaded once");
}

void test_status_text(TestSuite& suite) {
  hero::CognitiveLoad load;
  load.value = hero::CognitiveLoadEstimator::kBreakLoad;
  load.intervention = hero::CognitiveLoadEstimator::intervention_for(load.value);
  const hero::FlowAssessment flow;
  suite.require(load.intervention == hero::Intervention::SuggestBreak,
                "Load at the break threshold suggests a break");
  suite.require(hero::cognitive_status_text(load, flow) == "Take a break - cognitive load is high",
                "Status text agrees with the intervention at the threshold");

  load.value = hero::CognitiveLoadEstimator::kBreakLoad - 0.01;
  suite.require(hero::cognitive_status_text(load, flow) == "Continue current approach",
                "Below the threshold no break is suggested");
}

void test_history_sharing(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  const std::size_t count = hero::AttemptHistory::kChunkSize + 10;
  for (std::size_t i = 0; i < count; ++i) {
    engine->record_attempt(make_attempt("veteran", hero::kAllScenarios[i % 5], i % 2 == 0, 1.5, 1,
                                        0.2, at_seconds(static_cast<double>(i))));
  }
  const auto older = engine->export_user("veteran");
  engine->record_attempt(make_attempt("veteran", hero::ScenarioType::Train, true, 1.0, 1, 0.2,
                                      at_seconds(static_cast<double>(count))));
  const auto newer = engine->export_user("veteran");

  suite.require(older.history.size() == count && newer.history.size() == count + 1,
                "Earlier snapshots keep their own length");
  suite.require(newer.history.shares_chunk_with(older.history, 0),
                "Snapshots share the full history chunks");
  suite.require(older.history.back().timestamp == at_seconds(static_cast<double>(count - 1)),
                "Appending does not touch the earlier snapshot");
  suite.require(newer.history[count].scenario == hero::ScenarioType::Train,
                "The newest attempt is appended last");
  suite.require(newer.history.to_vector().size() == count + 1, "Flattening keeps every attempt");
}

void test_progress_report(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 12; ++i) {
    engine->record_attempt(make_attempt("report", hero::kAllScenarios[i % 2], i >= 4, 2.0, 1, 0.2,
                                        at_seconds(10.0 * i)));
  }
  const auto report = engine->get_progress_report("report", kEpoch);
  suite.require(report.total_attempts == 12, "Report counts the period's attempts");
  suite.require(std::abs(report.improvement_rate - 100.0) < 1e-9,
                "Improvement compares the last and first quarters");
  suite.require(report.scenarios.size() == 2, "Breakdown lists practiced scenarios");
  suite.require(!report.next_steps.empty(), "Report always suggests next steps");

  const auto recent = engine->get_progress_report("report", at_seconds(1000.0));
  suite.require(recent.total_attempts == 0, "Period filter excludes older attempts");
}

void test_concurrent_users(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  std::atomic<bool> failed{false};
  std::vector<std::thread> workers;

  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&engine, &failed, t] {
      try {
        const std::string user = "solo-" + std::to_string(t);
        for (int i = 0; i < 50; ++i) {
          engine->record_attempt(make_attempt(user, hero::kAllScenarios[i % 5], i % 2 == 0, 1.5,
                                              1, 0.2, at_seconds(i)));
          engine->get_recommendation(user);
        }
      } catch (const std::exception& ex) {
        std::cerr << "worker error: " << ex.what() << std::endl;
        failed = true;
      }
    });
  }
  for (int t = 0; t < 2; ++t) {
    workers.emplace_back([&engine, &failed, t] {
      try {
        for (int i = 0; i < 50; ++i) {
          engine->record_attempt(make_attempt("shared", hero::kAllScenarios[(i + t) % 5], true,
                                              1.2, 1, 0.2, at_seconds(i)));
          const auto state = engine->export_user("shared");
          std::size_t counted = 0;
          for (const auto& profile : state.profiles) counted += profile.attempt_count;
          if (counted != state.history.size()) {
            failed = true;
          }
        }
      } catch (const std::exception& ex) {
        std::cerr << "worker error: " << ex.what() << std::endl;
        failed = true;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  suite.require(!failed, "Concurrent users never fail or observe torn state");
  suite.require(engine->export_user("shared").history.size() == 100,
                "Attempts for one user are serialized without loss");
  for (int t = 0; t < 4; ++t) {
    suite.require(engine->export_user("solo-" + std::to_string(t)).history.size() == 50,
                  "Each independent user keeps its own attempts");
  }
}

void test_state_round_trip(TestSuite& suite) {
  auto engine = hero::make_engine(fixed_config());
  for (int i = 0; i < 8; ++i) {
    engine->record_attempt(make_attempt("mover", hero::kAllScenarios[i % 5], i % 3 != 1, 1.0 + i,
                                        2, 0.4, at_seconds(20.0 * i)));
  }
  const auto exported = hero::bridge::to_json(engine->export_user("mover"));
  const auto restored = hero::bridge::user_state_from_json(exported, 10);

  auto other = hero::make_engine(fixed_config());
  other->import_user("mover", restored);
  suite.require(hero::bridge::to_json(other->export_user("mover")) == exported,
                "Imported state matches the export");

  bool foreign = false;
  try {
    other->import_user("someone-else", restored);
  } catch (const std::invalid_argument&) {
    foreign = true;
  }
  suite.require(foreign, "History of another user cannot be imported");

  nlohmann::json broken = exported;
  broken["profiles"][0]["alpha"] = 0.2;
  bool rejected = false;
  try {
    hero::bridge::user_state_from_json(broken, 10);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  suite.require(rejected, "Profiles below the prior are rejected");
}

void test_config(TestSuite& suite) {
  hero::EngineConfig config;
  config.window_size = 0;
  bool threw = false;
  try {
    hero::make_engine(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "Zero window size is rejected");

  nlohmann::json json_config = nlohmann::json::object();
  json_config["window_size"] = 6;
  json_config["seed"] = 5;
  const auto parsed = hero::bridge::engine_config_from_json(json_config);
  suite.require(parsed.window_size == 6 && parsed.seed == 5, "Config fields parse from JSON");
  suite.require(parsed.clinical_min_attempts == 20, "Absent fields keep defaults");

  nlohmann::json negative_seed = nlohmann::json::object();
  negative_seed["seed"] = -1;
  bool seed_rejected = false;
  try {
    hero::bridge::engine_config_from_json(negative_seed);
  } catch (const std::invalid_argument&) {
    seed_rejected = true;
  }
  suite.require(seed_rejected, "Negative seeds are rejected");

  nlohmann::json big_seed = nlohmann::json::object();
  big_seed["seed"] = 18446744073709551615ULL;
  suite.require(hero::bridge::engine_config_from_json(big_seed).seed == 18446744073709551615ULL,
                "The full unsigned seed range parses");
}

void test_json_integer_ranges(TestSuite& suite) {
  nlohmann::json attempt = nlohmann::json::object();
  attempt["user_id"] = "wide";
  attempt["scenario"] = "train";
  attempt["success"] = true;
  attempt["difficulty_level"] = 4294967297LL;

  bool wrapped = false;
  try {
    hero::bridge::attempt_from_json(attempt, kEpoch);
  } catch (const std::invalid_argument&) {
    wrapped = true;
  }
  suite.require(wrapped, "Difficulty beyond the int range is rejected, not wrapped");

  attempt["difficulty_level"] = 1e12;
  bool huge_float = false;
  try {
    hero::bridge::attempt_from_json(attempt, kEpoch);
  } catch (const std::invalid_argument&) {
    huge_float = true;
  }
  suite.require(huge_float, "Out-of-range float difficulty is rejected");

  attempt["difficulty_level"] = 3;
  attempt["timestamp_ms"] = 18446744073709551615ULL;
  bool timestamp_rejected = false;
  try {
    hero::bridge::attempt_from_json(attempt, kEpoch);
  } catch (const std::invalid_argument&) {
    timestamp_rejected = true;
  }
  suite.require(timestamp_rejected, "Timestamps beyond int64 are rejected");

  attempt.erase("timestamp_ms");
  attempt["success"] = 4294967297LL;
  bool success_rejected = false;
  try {
    hero::bridge::attempt_from_json(attempt, kEpoch);
  } catch (const std::invalid_argument&) {
    success_rejected = true;
  }
  suite.require(success_rejected, "Wide integers are not read as booleans");

  attempt["success"] = 1;
  suite.require(hero::bridge::attempt_from_json(attempt, kEpoch).difficulty_level == 3,
                "In-range difficulty still parses");
}

} // namespace

int main() {
  TestSuite suite;

  test_new_user(suite);
  test_recommend_is_read_only(suite);
  test_invalid_attempts(suite);
  test_record_updates_components(suite);
  test_learning_gain(suite);
  test_scheduled_review(suite);
  test_level_derivation(suite);
  test_level_caps(suite);
  test_failing_store(suite);
  test_clinical_cache(suite);
  test_learning_curve(suite);
  test_unknown_user_reads(suite);
  test_status_text(suite);
  test_history_sharing(suite);
  test_progress_report(suite);
  test_concurrent_users(suite);
  test_state_round_trip(suite);
  test_config(suite);
  test_json_integer_ranges(suite);

  if (!suite.ok) {
    std::cerr << "Some engine tests failed" << std::endl;
    return 1;
  }
  std::cout << "All engine tests passed" << std::endl;
  return 0;
}
