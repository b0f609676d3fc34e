#include "RecallBridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "json_bridge.hpp"
#include "recall/errors.hpp"
#include "recall/evaluation.hpp"
#include "recall/item_store.hpp"
#include "recall/practice_engine.hpp"
#include "recall/scheduler.hpp"

struct recall_engine {
  std::mutex mutex;
  recall::InMemoryItemStore store;
  std::unique_ptr<recall::PracticeEngine> engine;
};

namespace {

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

nlohmann::json error_envelope(const std::string& kind, const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["kind"] = kind;
  payload["message"] = message;
  return payload;
}

// Runs `body` and turns every exception into an error envelope.
template <typename Body>
char* respond(Body&& body) {
  try {
    return copy_json(body());
  } catch (const recall::InvalidTransition& ex) {
    auto payload = error_envelope("invalid_transition", ex.what());
    payload["command"] = ex.command();
    payload["state"] = ex.state();
    return copy_json(payload);
  } catch (const recall::InvalidSubmissionShape& ex) {
    return copy_json(error_envelope("invalid_submission", ex.what()));
  } catch (const recall::ConflictError& ex) {
    auto payload = error_envelope("conflict", ex.what());
    payload["expected_version"] = ex.expected_version();
    payload["stored_version"] = ex.stored_version();
    return copy_json(payload);
  } catch (const recall::StorageError& ex) {
    return copy_json(error_envelope("storage", ex.what()));
  } catch (const recall::Error& ex) {
    return copy_json(error_envelope("error", ex.what()));
  } catch (const nlohmann::json::exception& ex) {
    return copy_json(error_envelope("invalid_json", ex.what()));
  } catch (const std::out_of_range& ex) {
    return copy_json(error_envelope("not_found", ex.what()));
  } catch (const std::invalid_argument& ex) {
    return copy_json(error_envelope("invalid_argument", ex.what()));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope("error", ex.what()));
  }
}

template <typename Body>
char* respond_locked(recall_engine* engine, Body&& body) {
  if (!engine) {
    return copy_json(error_envelope("invalid_argument", "Missing engine handle"));
  }
  std::scoped_lock guard(engine->mutex);
  return respond(std::forward<Body>(body));
}

std::string require_text(const char* value, const char* what) {
  if (!value) {
    throw std::invalid_argument(std::string("Missing ") + what);
  }
  return std::string(value);
}

nlohmann::json parse_json(const char* value, const char* what) {
  return nlohmann::json::parse(require_text(value, what));
}

nlohmann::json snapshot_payload(recall::PracticeEngine& engine, const std::string& session_id,
                                const recall::SessionSnapshot& snapshot) {
  nlohmann::json payload = ok_envelope();
  payload["snapshot"] = recall::bridge::to_json(snapshot);
  payload["pending_writes"] = engine.pending_writes(session_id);
  return payload;
}

struct Scope {
  std::string topic_id;
  std::vector<std::string> learning_path_ids;
};

Scope parse_scope(const char* scope_json) {
  const auto json = parse_json(scope_json, "scope json");
  // Same shape as a session configuration minus the counts.
  const auto configuration = recall::bridge::session_configuration_from_json(json);
  return Scope{configuration.topic_id, configuration.learning_path_ids};
}

} // namespace

extern "C" {

recall_engine* recall_engine_create(const char* config_json, const char* content_json,
                                    char** error_out) {
  if (error_out) {
    *error_out = nullptr;
  }
  try {
    auto handle = std::make_unique<recall_engine>();
    nlohmann::json config = nlohmann::json::object();
    if (config_json && std::strlen(config_json) > 0) {
      config = nlohmann::json::parse(config_json);
    }
    if (content_json && std::strlen(content_json) > 0) {
      for (auto& item : recall::bridge::load_content_items(nlohmann::json::parse(content_json))) {
        handle->store.add_item(std::move(item));
      }
    }
    handle->engine = recall::make_engine(handle->store, recall::bridge::engine_config_from_json(config));
    return handle.release();
  } catch (const std::exception& ex) {
    if (error_out) {
      *error_out = copy_json(error_envelope("invalid_argument", ex.what()));
    }
    return nullptr;
  }
}

void recall_engine_destroy(recall_engine* engine) {
  std::unique_ptr<recall_engine> owned{engine};
}

char* recall_create_session(recall_engine* engine, const char* configuration_json,
                            int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto configuration = recall::bridge::session_configuration_from_json(
        parse_json(configuration_json, "session configuration json"));
    const auto created = engine->engine->create_session(configuration, now_ms);
    nlohmann::json payload = ok_envelope();
    payload["session"] = recall::bridge::to_json(created);
    return payload;
  });
}

char* recall_start(recall_engine* engine, const char* session_id, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->start(id, now_ms));
  });
}

char* recall_submit_answer(recall_engine* engine, const char* session_id,
                           const char* submission_json, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    const auto submission =
        recall::bridge::submission_from_json(parse_json(submission_json, "submission json"));
    const auto outcome = engine->engine->submit_answer(id, submission, now_ms);
    nlohmann::json payload = ok_envelope();
    payload["outcome"] = recall::bridge::to_json(outcome);
    payload["pending_writes"] = engine->engine->pending_writes(id);
    return payload;
  });
}

char* recall_skip(recall_engine* engine, const char* session_id, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->skip(id, now_ms));
  });
}

char* recall_advance(recall_engine* engine, const char* session_id, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->advance(id, now_ms));
  });
}

char* recall_toggle_hint(recall_engine* engine, const char* session_id) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->toggle_hint(id));
  });
}

char* recall_cancel(recall_engine* engine, const char* session_id, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->cancel(id, now_ms));
  });
}

char* recall_finish(recall_engine* engine, const char* session_id, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->finish(id, now_ms));
  });
}

char* recall_snapshot(recall_engine* engine, const char* session_id) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->snapshot(id));
  });
}

char* recall_flush(recall_engine* engine, const char* session_id) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    engine->engine->flush(id);
    nlohmann::json payload = ok_envelope();
    payload["pending_writes"] = engine->engine->pending_writes(id);
    return payload;
  });
}

char* recall_reload_session(recall_engine* engine, const char* session_id) {
  return respond_locked(engine, [&] {
    const auto id = require_text(session_id, "session id");
    return snapshot_payload(*engine->engine, id, engine->engine->reload_session(id));
  });
}

char* recall_close_session(recall_engine* engine, const char* session_id) {
  return respond_locked(engine, [&] {
    engine->engine->close_session(require_text(session_id, "session id"));
    return ok_envelope();
  });
}

char* recall_schedule_stats(recall_engine* engine, const char* scope_json, int64_t now_ms) {
  return respond_locked(engine, [&] {
    const Scope scope = parse_scope(scope_json);
    nlohmann::json payload = ok_envelope();
    payload["stats"] = recall::bridge::to_json(
        engine->engine->schedule_stats(scope.topic_id, scope.learning_path_ids, now_ms));
    return payload;
  });
}

char* recall_review_forecast(recall_engine* engine, const char* scope_json, int64_t now_ms,
                             int days) {
  return respond_locked(engine, [&] {
    const Scope scope = parse_scope(scope_json);
    nlohmann::json payload = ok_envelope();
    payload["forecast"] = recall::bridge::to_json(
        engine->engine->review_forecast(scope.topic_id, scope.learning_path_ids, now_ms, days));
    return payload;
  });
}

char* recall_reschedule_item(recall_engine* engine, const char* item_id, int64_t new_due_at_ms,
                             int64_t now_ms) {
  return respond_locked(engine, [&] {
    const auto record = engine->engine->reschedule_item(require_text(item_id, "item id"),
                                                        new_due_at_ms, now_ms);
    nlohmann::json payload = ok_envelope();
    payload["record"] = recall::bridge::to_json(record);
    return payload;
  });
}

char* recall_evaluate(const char* item_json, const char* submission_json, uint64_t elapsed_ms) {
  return respond([&] {
    const auto item = recall::bridge::content_item_from_json(parse_json(item_json, "item json"));
    const auto submission =
        recall::bridge::submission_from_json(parse_json(submission_json, "submission json"));
    nlohmann::json payload = ok_envelope();
    payload["result"] = recall::bridge::to_json(recall::evaluate(item, submission, elapsed_ms));
    return payload;
  });
}

char* recall_update_record(const char* record_json, int quality, int64_t now_ms) {
  return respond([&] {
    const auto record =
        recall::bridge::scheduling_record_from_json(parse_json(record_json, "record json"));
    nlohmann::json payload = ok_envelope();
    payload["record"] = recall::bridge::to_json(recall::scheduler::update(record, quality, now_ms));
    return payload;
  });
}

void recall_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
