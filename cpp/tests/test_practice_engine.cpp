#include "../include/recall/errors.hpp"
#include "../include/recall/item_store.hpp"
#include "../include/recall/practice_engine.hpp"

#include "test_support.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace recall;
using namespace recall::testing;

namespace {

SessionConfiguration german(int target) {
  SessionConfiguration configuration;
  configuration.topic_id = "german";
  configuration.target_count = target;
  return configuration;
}

void fill(InMemoryItemStore& store, const std::vector<ContentItem>& items) {
  for (const auto& item : items) {
    store.add_item(item);
  }
}

EngineConfig by_id_config() {
  EngineConfig config;
  config.ordering = OrderingMode::ById;
  config.seed = 11;
  return config;
}

void test_create_session(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 3));
  auto other = numbered_items("other", 2);
  for (auto& item : other) {
    item.topic_id = "french";
  }
  fill(store, other);
  auto engine = make_engine(store, by_id_config());

  auto created = engine->create_session(german(10), kT0);
  suite.require(created.composition.task_ids.size() == 3, "create: only the topic's items");
  suite.require(created.composition.underflow(), "create: underflow reported, not thrown");
  suite.require(created.session_id.rfind("session-", 0) == 0, "create: id uses the prefix");
  suite.require(store.session_writes() == 1, "create: session stored once");

  auto snap = engine->snapshot(created.session_id);
  suite.require(snap.status == SessionStatus::NotStarted, "create: session not started");
  suite.require(snap.version == 1, "create: version from the store");
  suite.require(engine->session_ids() == std::vector<std::string>{created.session_id},
                "create: session registered");
  suite.require(throws<std::invalid_argument>([&] { engine->create_session(german(0), kT0); }),
                "create: non-positive target rejected");

  auto second = engine->create_session(german(5), kT0 + 1);
  suite.require(second.session_id != created.session_id, "create: ids are unique");
  SessionConfiguration missing = german(5);
  missing.topic_id = "latin";
  auto none = engine->create_session(missing, kT0 + 2);
  suite.require(none.composition.task_ids.empty(), "create: unknown topic composes nothing");
  suite.require(throws<InvalidTransition>([&] { engine->start(none.session_id, kT0 + 3); }),
                "create: empty session cannot start");
}

void test_full_run(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 3));
  auto engine = make_engine(store, by_id_config());
  auto id = engine->create_session(german(3), kT0).session_id;

  engine->start(id, kT0);
  TimestampMs now = kT0;
  for (int i = 0; i < 3; ++i) {
    now += 2000;
    auto outcome = engine->submit_answer(id, SelectedOption{i == 1 ? "a" : "c"}, now);
    suite.require(outcome.updated_record.has_value(), "run: each answer reschedules");
    now += 100;
    engine->advance(id, now);
  }

  auto snap = engine->snapshot(id);
  suite.require(snap.status == SessionStatus::Completed, "run: completed after the last advance");
  suite.require(snap.results.has_value() && near(snap.results->accuracy, 2.0 / 3.0),
                "run: accuracy 2/3");
  suite.require(engine->pending_writes(id) == 0, "run: nothing pending");
  suite.require(store.record_writes() == 3, "run: one record write per answer");

  auto stored_record = store.record("item-01");
  suite.require(stored_record.has_value() && stored_record->lapse_count == 1 &&
                    stored_record->repetition_count == 0 && stored_record->interval_days == 1,
                "run: wrong answer stored as a lapse");
  auto right = store.record("item-00");
  suite.require(right.has_value() && right->repetition_count == 1 &&
                    right->next_due_at == kT0 + 2000 + kMillisPerDay,
                "run: correct answer stored with next due date");
  suite.require(near(right->average_accuracy, 1.0) && near(right->average_time_ms, 2000.0),
                "run: passing review and its time folded into the record");
  suite.require(near(stored_record->average_accuracy, 0.0) &&
                    near(stored_record->average_time_ms, 2000.0),
                "run: failed review lowers accuracy but still times the answer");

  auto stats = engine->schedule_stats("german", {}, now);
  suite.require(near(stats.average_accuracy, 2.0 / 3.0), "run: stats average record accuracy");
  auto forecast = engine->review_forecast("german", {}, now, 2);
  suite.require(forecast[0].due_count == 3 && forecast[0].estimated_time_ms == 6000,
                "run: forecast estimates from measured answer times");

  auto stored = store.load_session(id);
  suite.require(stored.has_value() && stored->execution.status == SessionStatus::Completed,
                "run: completed session saved");
  suite.require(stored->version == snap.version, "run: engine tracks the stored version");

  engine->close_session(id);
  suite.require(engine->session_ids().empty(), "run: closed session forgotten");
  suite.require(throws<std::out_of_range>([&] { engine->snapshot(id); }),
                "run: closed session is unknown");
}

void test_storage_failure(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 2));
  auto engine = make_engine(store, by_id_config());
  auto id = engine->create_session(german(2), kT0).session_id;
  engine->start(id, kT0);

  store.fail_next_writes(1);
  suite.require(throws<StorageError>(
                    [&] { engine->submit_answer(id, SelectedOption{"c"}, kT0 + 500); }),
                "storage: failure is reported");
  auto snap = engine->snapshot(id);
  suite.require(snap.phase == TaskPhase::Answered, "storage: state advanced in memory");
  suite.require(snap.last_result.has_value() && snap.last_result->correct,
                "storage: result available from the snapshot");
  suite.require(engine->pending_writes(id) == 2, "storage: record and session queued");
  suite.require(!store.record("item-00").has_value(), "storage: nothing reached the store");

  auto repeat = engine->submit_answer(id, SelectedOption{"c"}, kT0 + 600);
  suite.require(repeat.duplicate, "storage: retrying the submission is absorbed");
  suite.require(engine->pending_writes(id) == 2, "storage: duplicate queues nothing new");

  engine->flush(id);
  suite.require(engine->pending_writes(id) == 0, "storage: flush drains the queue");
  suite.require(store.record("item-00").has_value() && store.record("item-00")->total_reviews == 1,
                "storage: record written exactly once");

  store.fail_next_writes(1);
  suite.require(throws<StorageError>([&] { engine->advance(id, kT0 + 700); }),
                "storage: session save failure reported");
  suite.require(engine->pending_writes(id) == 1, "storage: session queued");
  engine->skip(id, kT0 + 800);
  suite.require(engine->pending_writes(id) == 0, "storage: next command carries the queue");
  suite.require(store.load_session(id)->execution.status == SessionStatus::Completed,
                "storage: latest state saved");
}

void test_failed_creation(TestSuite& suite) {
  InMemoryItemStore store_a;
  InMemoryItemStore store_b;
  fill(store_a, numbered_items("item", 12));
  fill(store_b, numbered_items("item", 12));
  EngineConfig config;
  config.seed = 99;
  auto engine_a = make_engine(store_a, config);
  auto engine_b = make_engine(store_b, config);

  store_a.fail_next_writes(1);
  suite.require(throws<StorageError>([&] { engine_a->create_session(german(6), kT0); }),
                "creation: initial save failure reported");
  suite.require(engine_a->session_ids().empty(), "creation: failed session discarded");

  auto a = engine_a->create_session(german(6), kT0);
  auto b = engine_b->create_session(german(6), kT0);
  suite.require(a.composition.task_ids == b.composition.task_ids,
                "creation: failed attempt does not consume randomness");
}

void test_conflict(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 3));
  auto engine = make_engine(store, by_id_config());
  auto id = engine->create_session(german(3), kT0).session_id;
  engine->start(id, kT0);
  engine->submit_answer(id, SelectedOption{"c"}, kT0 + 1000);

  store.touch_session(id);
  bool conflict = false;
  try {
    engine->advance(id, kT0 + 1100);
  } catch (const ConflictError& e) {
    conflict = e.session_id() == id && e.stored_version() == e.expected_version() + 1;
  }
  suite.require(conflict, "conflict: stale version detected");
  suite.require(engine->pending_writes(id) == 1, "conflict: session still dirty");

  auto reloaded = engine->reload_session(id);
  suite.require(reloaded.phase == TaskPhase::Answered, "conflict: reload restores stored state");
  suite.require(reloaded.version == store.load_session(id)->version,
                "conflict: reload adopts the stored version");
  suite.require(engine->pending_writes(id) == 0, "conflict: nothing pending after reload");

  auto repeat = engine->submit_answer(id, SelectedOption{"c"}, kT0 + 1200);
  suite.require(repeat.duplicate && repeat.result.correct,
                "conflict: answered task regraded without committing");
  engine->advance(id, kT0 + 1300);
  suite.require(engine->snapshot(id).current_item->id == "item-01",
                "conflict: session continues after reload");
  suite.require(engine->pending_writes(id) == 0, "conflict: saves succeed after reload");
}

void test_unknown_ids(TestSuite& suite) {
  InMemoryItemStore store;
  auto engine = make_engine(store);
  suite.require(throws<std::out_of_range>([&] { engine->start("nope", kT0); }), "unknown: start");
  suite.require(throws<std::out_of_range>([&] { engine->pending_writes("nope"); }),
                "unknown: pending_writes");
  suite.require(throws<std::out_of_range>([&] { engine->toggle_hint("nope"); }),
                "unknown: toggle_hint");

  EngineConfig bad;
  bad.session_prefix.clear();
  suite.require(throws<std::invalid_argument>([&] { make_engine(store, bad); }),
                "config: empty prefix rejected");
}

void test_hint_not_persisted(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 2));
  auto engine = make_engine(store, by_id_config());
  auto id = engine->create_session(german(2), kT0).session_id;
  engine->start(id, kT0);
  const auto writes = store.session_writes();
  auto snap = engine->toggle_hint(id);
  suite.require(snap.hint_visible && snap.hint.has_value(), "hint: visible after toggle");
  suite.require(store.session_writes() == writes, "hint: toggle does not write");
  engine->skip(id, kT0 + 10);
  suite.require(store.load_session(id)->execution.hints_used == 1,
                "hint: counter saved with the next write");
}

void test_statistics(TestSuite& suite) {
  InMemoryItemStore store;
  fill(store, numbered_items("item", 4));
  auto engine = make_engine(store);

  auto moved = engine->reschedule_item("item-02", kT0 + 2 * kMillisPerDay, kT0);
  suite.require(moved.next_due_at == kT0 + 2 * kMillisPerDay, "reschedule: due date moved");
  suite.require(store.record("item-02").has_value(), "reschedule: record stored");

  SchedulingRecord due = scheduler::make_initial_record("item-00", kT0 - kMillisPerDay);
  store.put_record(due);

  auto stats = engine->schedule_stats("german", {}, kT0);
  suite.require(stats.total_items == 2, "stats: only items with records");
  suite.require(stats.due_now == 1, "stats: one due");

  auto forecast = engine->review_forecast("german", {"basics"}, kT0, 3);
  suite.require(forecast.size() == 3 && forecast[0].due_count == 1 && forecast[2].due_count == 1,
                "forecast: overdue today, rescheduled on day 2");
  auto elsewhere = engine->review_forecast("german", {"advanced"}, kT0, 3);
  suite.require(elsewhere[0].due_count == 0 && elsewhere[2].due_count == 0,
                "forecast: filtered by learning path");
}

void test_determinism(TestSuite& suite) {
  InMemoryItemStore store_a;
  InMemoryItemStore store_b;
  fill(store_a, numbered_items("item", 20));
  fill(store_b, numbered_items("item", 20));
  EngineConfig config;
  config.seed = 2024;
  auto a = make_engine(store_a, config);
  auto b = make_engine(store_b, config);
  auto first_a = a->create_session(german(8), kT0);
  auto first_b = b->create_session(german(8), kT0);
  auto second_a = a->create_session(german(8), kT0);
  auto second_b = b->create_session(german(8), kT0);
  suite.require(first_a.composition.task_ids == first_b.composition.task_ids &&
                    second_a.composition.task_ids == second_b.composition.task_ids,
                "seeded engines compose identically");
  suite.require(first_a.session_id == first_b.session_id, "session ids are reproducible");
}

} // namespace

int main() {
  TestSuite suite;
  test_create_session(suite);
  test_full_run(suite);
  test_storage_failure(suite);
  test_failed_creation(suite);
  test_conflict(suite);
  test_unknown_ids(suite);
  test_hint_not_persisted(suite);
  test_statistics(suite);
  test_determinism(suite);
  return recall::testing::finish(suite, "Practice engine");
}
