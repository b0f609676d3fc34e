#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct recall_engine recall_engine;

// Returns NULL on failure and, when `error_out` is non-NULL, an error envelope there.
recall_engine *recall_engine_create(const char *config_json, const char *content_json,
                                    char **error_out);
void recall_engine_destroy(recall_engine *engine);

// Every call below returns a JSON envelope: {"status":"ok",...} or
// {"status":"error","kind":...,"message":...}. Release it with recall_free_string.
char *recall_create_session(recall_engine *engine, const char *configuration_json, int64_t now_ms);
char *recall_start(recall_engine *engine, const char *session_id, int64_t now_ms);
char *recall_submit_answer(recall_engine *engine, const char *session_id,
                           const char *submission_json, int64_t now_ms);
char *recall_skip(recall_engine *engine, const char *session_id, int64_t now_ms);
char *recall_advance(recall_engine *engine, const char *session_id, int64_t now_ms);
char *recall_toggle_hint(recall_engine *engine, const char *session_id);
char *recall_cancel(recall_engine *engine, const char *session_id, int64_t now_ms);
char *recall_finish(recall_engine *engine, const char *session_id, int64_t now_ms);
char *recall_snapshot(recall_engine *engine, const char *session_id);
char *recall_flush(recall_engine *engine, const char *session_id);
char *recall_reload_session(recall_engine *engine, const char *session_id);
char *recall_close_session(recall_engine *engine, const char *session_id);

// `scope_json`: {"topic_id": ..., "learning_path_ids": [...]}
char *recall_schedule_stats(recall_engine *engine, const char *scope_json, int64_t now_ms);
char *recall_review_forecast(recall_engine *engine, const char *scope_json, int64_t now_ms,
                             int days);
char *recall_reschedule_item(recall_engine *engine, const char *item_id, int64_t new_due_at_ms,
                             int64_t now_ms);

// Stateless helpers.
char *recall_evaluate(const char *item_json, const char *submission_json, uint64_t elapsed_ms);
char *recall_update_record(const char *record_json, int quality, int64_t now_ms);

void recall_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
