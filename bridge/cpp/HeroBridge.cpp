#include "HeroBridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "hero/recommendation_engine.hpp"
#include "json_bridge.hpp"
#include "debug_log.hpp"

namespace {

struct EngineState {
  std::mutex mutex;
  std::shared_ptr<hero::RecommendationEngine> engine;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

// The engine handle is copied out so calls for different users do not
// serialize on the bridge mutex.
std::shared_ptr<hero::RecommendationEngine> ensure_engine() {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (!s.engine) {
    s.engine = hero::make_engine();
  }
  return s.engine;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message, bool retryable) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  payload["retryable"] = retryable;
  return payload;
}

std::string require_text(const char* value, const char* what) {
  if (!value) {
    throw std::invalid_argument(std::string(what) + " must not be null");
  }
  return std::string(value);
}

nlohmann::json parse_json(const char* text, const char* what) {
  return nlohmann::json::parse(require_text(text, what));
}

template <typename Fn>
char* guarded(const char* op, Fn&& fn) {
  try {
    return copy_json(fn());
  } catch (const hero::StoreUnavailable& ex) {
    hero::detail::debug_log("bridge", std::string(op) + " store unavailable: " + ex.what());
    return copy_json(error_envelope(ex.what(), ex.retryable()));
  } catch (const std::exception& ex) {
    hero::detail::debug_log("bridge", std::string(op) + " failed: " + ex.what());
    return copy_json(error_envelope(ex.what(), false));
  }
}

} // namespace

extern "C" {

char* hero_configure(const char* config_json) {
  return guarded("configure", [&] {
    const auto config = hero::bridge::engine_config_from_json(
        config_json ? nlohmann::json::parse(config_json) : nlohmann::json());
    std::shared_ptr<hero::RecommendationEngine> engine = hero::make_engine(config);
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    s.engine = engine;
    nlohmann::json payload = ok_envelope();
    payload["config"] = hero::bridge::to_json(engine->config());
    return payload;
  });
}

char* hero_record_attempt(const char* attempt_json) {
  return guarded("record_attempt", [&] {
    auto engine = ensure_engine();
    const auto attempt =
        hero::bridge::attempt_from_json(parse_json(attempt_json, "attempt"), engine->config().now());
    engine->record_attempt(attempt);
    return ok_envelope();
  });
}

char* hero_get_recommendation(const char* user_id) {
  return guarded("get_recommendation", [&] {
    nlohmann::json payload = ok_envelope();
    payload["recommendation"] =
        hero::bridge::to_json(ensure_engine()->get_recommendation(require_text(user_id, "user_id")));
    return payload;
  });
}

char* hero_get_cognitive_status(const char* user_id) {
  return guarded("get_cognitive_status", [&] {
    nlohmann::json payload = ok_envelope();
    payload["cognitive_status"] =
        hero::bridge::to_json(ensure_engine()->get_cognitive_status(require_text(user_id, "user_id")));
    return payload;
  });
}

char* hero_get_clinical_assessment(const char* user_id) {
  return guarded("get_clinical_assessment", [&] {
    nlohmann::json payload = ok_envelope();
    payload["assessment"] = hero::bridge::to_json(
        ensure_engine()->get_clinical_assessment(require_text(user_id, "user_id")));
    return payload;
  });
}

char* hero_get_clinical_recommendations(const char* user_id) {
  return guarded("get_clinical_recommendations", [&] {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& rec :
         ensure_engine()->get_clinical_recommendations(require_text(user_id, "user_id"))) {
      items.push_back(hero::bridge::to_json(rec));
    }
    nlohmann::json payload = ok_envelope();
    payload["recommendations"] = items;
    return payload;
  });
}

char* hero_get_learning_curve(const char* user_id) {
  return guarded("get_learning_curve", [&] {
    nlohmann::json payload = ok_envelope();
    payload["learning_curve"] =
        hero::bridge::to_json(ensure_engine()->get_learning_curve(require_text(user_id, "user_id")));
    return payload;
  });
}

char* hero_get_progress_report(const char* user_id, long long since_ms) {
  return guarded("get_progress_report", [&] {
    nlohmann::json payload = ok_envelope();
    payload["report"] = hero::bridge::to_json(ensure_engine()->get_progress_report(
        require_text(user_id, "user_id"), hero::from_epoch_ms(since_ms)));
    return payload;
  });
}

char* hero_export_user(const char* user_id) {
  return guarded("export_user", [&] {
    nlohmann::json payload = ok_envelope();
    payload["state"] =
        hero::bridge::to_json(ensure_engine()->export_user(require_text(user_id, "user_id")));
    return payload;
  });
}

char* hero_import_user(const char* user_id, const char* state_json) {
  return guarded("import_user", [&] {
    auto engine = ensure_engine();
    const auto user = require_text(user_id, "user_id");
    const auto imported = hero::bridge::user_state_from_json(parse_json(state_json, "state"),
                                                             engine->config().window_size);
    engine->import_user(user, imported);
    return ok_envelope();
  });
}

char* hero_debug_state(const char* user_id) {
  return guarded("debug_state", [&] {
    nlohmann::json payload = ok_envelope();
    payload["debug"] = ensure_engine()->debug_state(require_text(user_id, "user_id"));
    return payload;
  });
}

void hero_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
