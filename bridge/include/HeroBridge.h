#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Every call returns a malloc'd JSON envelope {"status":"ok",...} or
// {"status":"error","message":...,"retryable":bool}; release it with
// hero_free_string.

char *hero_configure(const char *config_json);
char *hero_record_attempt(const char *attempt_json);
char *hero_get_recommendation(const char *user_id);
char *hero_get_cognitive_status(const char *user_id);
char *hero_get_clinical_assessment(const char *user_id);
char *hero_get_clinical_recommendations(const char *user_id);
char *hero_get_learning_curve(const char *user_id);
char *hero_get_progress_report(const char *user_id, long long since_ms);
char *hero_export_user(const char *user_id);
char *hero_import_user(const char *user_id, const char *state_json);
char *hero_debug_state(const char *user_id);
void hero_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
