#pragma once

#include "scheduler.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recall {

struct SubmitOutcome {
  EvaluationResult result;
  // Absent for duplicates: the first submission already fed the scheduler.
  std::optional<SchedulingRecord> updated_record;
  bool duplicate = false;
};

struct SessionSnapshot {
  std::string session_id;
  SessionStatus status = SessionStatus::NotStarted;
  SessionExecution execution;
  std::optional<ContentItem> current_item;
  std::optional<TaskPhase> phase;
  bool hint_visible = false;
  std::optional<std::string> hint;
  std::optional<EvaluationResult> last_result;
  std::optional<SessionResults> results;
  std::uint64_t version = 0;
};

// Progress of one practice session. Commands either complete or throw without
// changing anything; commands issued in the wrong state throw InvalidTransition.
class SessionMachine {
public:
  // `items` must cover every id in the session's task list (std::invalid_argument
  // otherwise). `records` seeds the scheduling state of those items.
  SessionMachine(PracticeSession session, const std::vector<ContentItem>& items, RecordMap records,
                 scheduler::SchedulerConfig config = scheduler::SchedulerConfig{});

  void start(TimestampMs now);

  // Presented: grade, count, reschedule, move to Answered. Answered: duplicate, the
  // earlier result is returned and nothing changes.
  SubmitOutcome submit_answer(const Submission& submission, TimestampMs now);

  void skip(TimestampMs now);
  void advance(TimestampMs now);

  // Returns the new visibility.
  bool toggle_hint();

  void cancel(TimestampMs now);
  void finish(TimestampMs now);

  SessionSnapshot snapshot() const;

  const PracticeSession& session() const noexcept { return session_; }
  void set_version(std::uint64_t version) noexcept { session_.version = version; }

  std::optional<SchedulingRecord> record(const std::string& item_id) const;
  const ContentItem* current_item() const;
  bool hint_visible() const noexcept { return hint_visible_; }
  bool finished() const noexcept;

private:
  std::string state_label() const;
  void require_in_progress(const char* command) const;
  void require_phase(const char* command, TaskPhase phase) const;
  const ContentItem& item_at(std::size_t index) const;
  // Moves past the current task: presents the next one or completes the session.
  void step_forward(SessionExecution& execution, SessionResults& results, TimestampMs now) const;
  static void finalize(SessionExecution& execution, SessionResults& results, TimestampMs now);

  PracticeSession session_;
  std::unordered_map<std::string, ContentItem> items_;
  RecordMap records_;
  scheduler::SchedulerConfig config_;
  bool hint_visible_ = false;
  std::optional<SubmitOutcome> last_outcome_;
};

} // namespace recall
