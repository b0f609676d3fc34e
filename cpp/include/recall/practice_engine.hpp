#pragma once

#include "item_store.hpp"
#include "scheduler.hpp"
#include "session_composer.hpp"
#include "session_machine.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace recall {

struct EngineConfig {
  scheduler::SchedulerConfig scheduler{};
  OrderingMode ordering = OrderingMode::Shuffled;
  std::uint64_t seed = 0;
  std::string session_prefix = "session";

  void validate() const;
};

struct CreatedSession {
  std::string session_id;
  Composition composition;
};

// Owns practice sessions by id and performs all store I/O around the pure core.
// Unknown session ids throw std::out_of_range.
//
// Writes are at-least-once. When a save fails the in-memory session has already
// advanced; the failed writes stay queued (`pending_writes`) and go out again on the
// next command or on `flush`. Storage errors are always rethrown to the caller.
class PracticeEngine {
public:
  virtual ~PracticeEngine() = default;

  // Loads the pool and records, composes the task list and stores the new session.
  // Underflow is reported in the returned composition.
  virtual CreatedSession create_session(const SessionConfiguration& configuration,
                                        TimestampMs now) = 0;

  virtual SessionSnapshot start(const std::string& session_id, TimestampMs now) = 0;

  virtual SubmitOutcome submit_answer(const std::string& session_id, const Submission& submission,
                                      TimestampMs now) = 0;

  virtual SessionSnapshot skip(const std::string& session_id, TimestampMs now) = 0;

  virtual SessionSnapshot advance(const std::string& session_id, TimestampMs now) = 0;

  // Visibility is session-local; the hint counter is saved with the next write.
  virtual SessionSnapshot toggle_hint(const std::string& session_id) = 0;

  virtual SessionSnapshot cancel(const std::string& session_id, TimestampMs now) = 0;

  virtual SessionSnapshot finish(const std::string& session_id, TimestampMs now) = 0;

  virtual SessionSnapshot snapshot(const std::string& session_id) const = 0;

  // Queued record writes plus one if the session itself still needs saving.
  virtual std::size_t pending_writes(const std::string& session_id) const = 0;

  virtual void flush(const std::string& session_id) = 0;

  // Replaces the in-memory session with the stored one after a ConflictError. Queued
  // record writes are kept and overlay the stored records.
  virtual SessionSnapshot reload_session(const std::string& session_id) = 0;

  // Flushes outstanding writes, then forgets the session.
  virtual void close_session(const std::string& session_id) = 0;

  virtual std::vector<std::string> session_ids() const = 0;

  virtual scheduler::ScheduleStats schedule_stats(const std::string& topic_id,
                                                  const std::vector<std::string>& learning_path_ids,
                                                  TimestampMs now) = 0;

  virtual std::vector<scheduler::DailyLoad> review_forecast(
      const std::string& topic_id, const std::vector<std::string>& learning_path_ids,
      TimestampMs now, int days) = 0;

  // Moves an item's next review to `new_due_at`, creating its record if needed.
  virtual SchedulingRecord reschedule_item(const std::string& item_id, TimestampMs new_due_at,
                                           TimestampMs now) = 0;

  virtual const EngineConfig& config() const noexcept = 0;
};

// `store` must outlive the engine.
std::unique_ptr<PracticeEngine> make_engine(ItemStore& store, EngineConfig config = EngineConfig{});

} // namespace recall
