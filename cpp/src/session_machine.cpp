#include "recall/session_machine.hpp"

#include "recall/errors.hpp"
#include "recall/evaluation.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace recall {

SessionMachine::SessionMachine(PracticeSession session, const std::vector<ContentItem>& items,
                               RecordMap records, scheduler::SchedulerConfig config)
    : session_(std::move(session)), records_(std::move(records)), config_(std::move(config)) {
  config_.validate();
  for (const auto& item : items) {
    items_.emplace(item.id, item);
  }
  const auto& execution = session_.execution;
  for (const auto& id : execution.task_ids) {
    if (items_.find(id) == items_.end()) {
      throw std::invalid_argument("Session '" + session_.id + "' references unknown item '" + id +
                                  "'");
    }
  }
  if (execution.cursor > execution.task_ids.size()) {
    throw std::invalid_argument("Session '" + session_.id + "' cursor is past its task list");
  }
  if (execution.status == SessionStatus::InProgress &&
      execution.cursor >= execution.task_ids.size()) {
    throw std::invalid_argument("Session '" + session_.id + "' is in progress with no current task");
  }
}

bool SessionMachine::finished() const noexcept {
  const auto status = session_.execution.status;
  return status == SessionStatus::Completed || status == SessionStatus::Cancelled;
}

std::string SessionMachine::state_label() const {
  const auto& execution = session_.execution;
  if (execution.status == SessionStatus::InProgress) {
    return "in_progress/" + to_string(execution.phase);
  }
  return to_string(execution.status);
}

void SessionMachine::require_in_progress(const char* command) const {
  if (session_.execution.status != SessionStatus::InProgress) {
    throw InvalidTransition(command, state_label());
  }
}

void SessionMachine::require_phase(const char* command, TaskPhase phase) const {
  require_in_progress(command);
  if (session_.execution.phase != phase) {
    throw InvalidTransition(command, state_label());
  }
}

const ContentItem& SessionMachine::item_at(std::size_t index) const {
  return items_.at(session_.execution.task_ids.at(index));
}

const ContentItem* SessionMachine::current_item() const {
  const auto& execution = session_.execution;
  if (execution.status != SessionStatus::InProgress ||
      execution.cursor >= execution.task_ids.size()) {
    return nullptr;
  }
  return &item_at(execution.cursor);
}

std::optional<SchedulingRecord> SessionMachine::record(const std::string& item_id) const {
  auto it = records_.find(item_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SessionMachine::finalize(SessionExecution& execution, SessionResults& results,
                              TimestampMs now) {
  execution.status = SessionStatus::Completed;
  execution.completed_at = now;
  execution.presented_at.reset();
  execution.phase = TaskPhase::Presented;

  SessionResults finalized;
  if (execution.completed_count > 0) {
    const double completed = static_cast<double>(execution.completed_count);
    finalized.accuracy = static_cast<double>(execution.correct_count) / completed;
    finalized.average_time_ms = static_cast<double>(execution.total_time_ms) / completed;
  }
  finalized.by_variant = execution.variant_stats;
  results = std::move(finalized);
}

void SessionMachine::step_forward(SessionExecution& execution, SessionResults& results,
                                  TimestampMs now) const {
  ++execution.cursor;
  if (execution.cursor >= execution.task_ids.size()) {
    execution.cursor = execution.task_ids.size();
    finalize(execution, results, now);
    return;
  }
  execution.phase = TaskPhase::Presented;
  execution.presented_at = now;
}

void SessionMachine::start(TimestampMs now) {
  if (session_.execution.status != SessionStatus::NotStarted) {
    throw InvalidTransition("start", state_label());
  }
  if (session_.execution.task_ids.empty()) {
    throw InvalidTransition("start", "not_started with an empty task list");
  }
  SessionExecution execution = session_.execution;
  execution.status = SessionStatus::InProgress;
  execution.started_at = now;
  execution.cursor = 0;
  execution.phase = TaskPhase::Presented;
  execution.presented_at = now;

  session_.execution = std::move(execution);
  hint_visible_ = false;
  last_outcome_.reset();
}

SubmitOutcome SessionMachine::submit_answer(const Submission& submission, TimestampMs now) {
  require_in_progress("submit_answer");
  const ContentItem& item = item_at(session_.execution.cursor);

  if (session_.execution.phase == TaskPhase::Answered) {
    if (last_outcome_.has_value()) {
      SubmitOutcome repeat = *last_outcome_;
      repeat.updated_record.reset();
      repeat.duplicate = true;
      return repeat;
    }
    // Restored in Answered without the original result: regrade, commit nothing.
    SubmitOutcome repeat;
    repeat.result = evaluate(item, submission, 0);
    repeat.duplicate = true;
    return repeat;
  }

  const TimestampMs presented_at = session_.execution.presented_at.value_or(now);
  const auto elapsed = static_cast<std::uint64_t>(std::max<TimestampMs>(0, now - presented_at));
  EvaluationResult result = evaluate(item, submission, elapsed);

  auto existing = records_.find(item.id);
  const SchedulingRecord base = existing == records_.end()
                                    ? scheduler::make_initial_record(item.id, now)
                                    : existing->second;
  const scheduler::Quality quality =
      scheduler::quality_for(item.variant(), result, config_.quality_table);
  SchedulingRecord updated =
      scheduler::record_review_time(scheduler::update(base, quality, now, config_), elapsed);

  SessionExecution execution = session_.execution;
  execution.phase = TaskPhase::Answered;
  execution.completed_count += 1;
  if (result.correct) {
    execution.correct_count += 1;
  }
  execution.total_time_ms += static_cast<std::int64_t>(elapsed);
  auto& breakdown = execution.variant_stats[item.variant()];
  breakdown.attempted += 1;
  if (result.correct) {
    breakdown.correct += 1;
  }
  breakdown.total_time_ms += static_cast<std::int64_t>(elapsed);
  breakdown.score_sum += result.score;

  SubmitOutcome outcome;
  outcome.result = std::move(result);
  outcome.updated_record = updated;

  records_[item.id] = std::move(updated);
  session_.execution = std::move(execution);
  hint_visible_ = false;
  last_outcome_ = outcome;
  return outcome;
}

void SessionMachine::skip(TimestampMs now) {
  require_phase("skip", TaskPhase::Presented);
  SessionExecution execution = session_.execution;
  SessionResults results = session_.results;
  execution.skipped_count += 1;
  step_forward(execution, results, now);

  session_.execution = std::move(execution);
  session_.results = std::move(results);
  hint_visible_ = false;
}

void SessionMachine::advance(TimestampMs now) {
  require_phase("advance", TaskPhase::Answered);
  SessionExecution execution = session_.execution;
  SessionResults results = session_.results;
  step_forward(execution, results, now);

  session_.execution = std::move(execution);
  session_.results = std::move(results);
  hint_visible_ = false;
}

bool SessionMachine::toggle_hint() {
  require_phase("toggle_hint", TaskPhase::Presented);
  const bool visible = !hint_visible_;
  if (visible && item_at(session_.execution.cursor).hint.has_value()) {
    session_.execution.hints_used += 1;
  }
  hint_visible_ = visible;
  return hint_visible_;
}

void SessionMachine::cancel(TimestampMs /*now*/) {
  require_in_progress("cancel");
  session_.execution.status = SessionStatus::Cancelled;
  session_.execution.presented_at.reset();
  hint_visible_ = false;
}

void SessionMachine::finish(TimestampMs now) {
  require_in_progress("finish");
  SessionExecution execution = session_.execution;
  SessionResults results = session_.results;
  finalize(execution, results, now);

  session_.execution = std::move(execution);
  session_.results = std::move(results);
  hint_visible_ = false;
}

SessionSnapshot SessionMachine::snapshot() const {
  SessionSnapshot snap;
  snap.session_id = session_.id;
  snap.status = session_.execution.status;
  snap.execution = session_.execution;
  snap.version = session_.version;
  if (const ContentItem* item = current_item()) {
    snap.current_item = *item;
    snap.phase = session_.execution.phase;
    snap.hint_visible = hint_visible_;
    if (hint_visible_) {
      snap.hint = item->hint;
    }
  }
  if (last_outcome_.has_value()) {
    snap.last_result = last_outcome_->result;
  }
  if (session_.execution.status == SessionStatus::Completed) {
    snap.results = session_.results;
  }
  return snap;
}

} // namespace recall
