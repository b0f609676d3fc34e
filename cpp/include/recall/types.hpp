#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace recall {

// Milliseconds since the Unix epoch.
using TimestampMs = std::int64_t;

constexpr TimestampMs kMillisPerDay = 86'400'000;

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

} // namespace detail

// Order matches the alternatives of `Payload`.
enum class Variant {
  MultipleChoice,
  MultiSelect,
  ClozeDeletion,
  Matching,
  Ordering,
  TrueFalse,
  Slider,
  TextInput,
  WordScramble,
  ErrorDetection,
  Flashcard
};

inline std::string to_string(Variant variant) {
  switch (variant) {
    case Variant::MultipleChoice: return "multiple-choice";
    case Variant::MultiSelect: return "multi-select";
    case Variant::ClozeDeletion: return "cloze-deletion";
    case Variant::Matching: return "matching";
    case Variant::Ordering: return "ordering";
    case Variant::TrueFalse: return "true-false";
    case Variant::Slider: return "slider";
    case Variant::TextInput: return "text-input";
    case Variant::WordScramble: return "word-scramble";
    case Variant::ErrorDetection: return "error-detection";
    case Variant::Flashcard: return "flashcard";
  }
  return "multiple-choice";
}

inline Variant variant_from_string(const std::string& value) {
  static const std::unordered_map<std::string, Variant> lookup = {
      {"multiple-choice", Variant::MultipleChoice},
      {"multi-select", Variant::MultiSelect},
      {"multiple-select", Variant::MultiSelect},
      {"cloze-deletion", Variant::ClozeDeletion},
      {"matching", Variant::Matching},
      {"ordering", Variant::Ordering},
      {"true-false", Variant::TrueFalse},
      {"slider", Variant::Slider},
      {"text-input", Variant::TextInput},
      {"word-scramble", Variant::WordScramble},
      {"error-detection", Variant::ErrorDetection},
      {"flashcard", Variant::Flashcard}};
  auto it = lookup.find(value);
  if (it == lookup.end()) {
    throw std::invalid_argument("Unknown task variant: " + value);
  }
  return it->second;
}

// --- Task payloads ---

struct ChoiceOption {
  std::string id;
  std::string text;
};

struct MultipleChoicePayload {
  std::string question;
  std::vector<ChoiceOption> options;
  std::string correct_option_id;
};

struct MultiSelectPayload {
  std::string question;
  std::vector<ChoiceOption> options;
  std::set<std::string> correct_option_ids;
};

struct ClozeBlank {
  std::string answer;
  std::vector<std::string> alternatives;
};

struct ClozePayload {
  std::string text;               // blanks marked as {{...}}
  std::vector<ClozeBlank> blanks; // in order of appearance
};

struct MatchPair {
  std::string left_id;
  std::string left;
  std::string right_id;
  std::string right;
};

struct MatchingPayload {
  std::string question;
  std::vector<MatchPair> pairs;
};

struct OrderingPayload {
  std::string question;
  std::vector<ChoiceOption> items;        // presentation order
  std::vector<std::string> correct_order; // item ids
};

struct TrueFalsePayload {
  std::string statement;
  bool answer = false;
};

struct SliderPayload {
  std::string question;
  double min = 0.0;
  double max = 100.0;
  double step = 1.0;
  double target = 0.0;
  double tolerance = 0.0;
  std::string unit;
};

struct TextInputPayload {
  std::string question;
  std::vector<std::string> accepted;
  bool case_sensitive = false;
};

struct WordScramblePayload {
  std::string question;
  std::string scrambled;
  std::string target;
  bool show_length = false;
};

struct ErrorDetectionPayload {
  std::vector<std::string> segments;
  std::set<std::size_t> error_indices;
};

struct FlashcardPayload {
  std::string front;
  std::string back;
  std::string front_language;
  std::string back_language;
};

using Payload = std::variant<MultipleChoicePayload, MultiSelectPayload, ClozePayload,
                             MatchingPayload, OrderingPayload, TrueFalsePayload, SliderPayload,
                             TextInputPayload, WordScramblePayload, ErrorDetectionPayload,
                             FlashcardPayload>;

inline Variant variant_of(const Payload& payload) {
  return static_cast<Variant>(payload.index());
}

struct ContentItem {
  std::string id;
  std::string topic_id;
  std::string learning_path_id;
  Payload payload;
  std::optional<std::string> hint;
  std::optional<std::string> explanation;

  Variant variant() const { return variant_of(payload); }
};

// --- Submissions ---

struct SelectedOption {
  std::string option_id;
};

struct SelectedOptions {
  std::set<std::string> option_ids;
};

struct BlankAnswers {
  std::vector<std::string> blanks;
};

struct PairAssignments {
  std::map<std::string, std::string> pairs; // left id -> right id
};

struct SequenceAnswer {
  std::vector<std::string> order;
};

struct TruthAnswer {
  bool value = false;
};

struct NumericAnswer {
  double value = 0.0;
};

struct FreeTextAnswer {
  std::string text;
};

struct SpanSelection {
  std::set<std::size_t> indices;
};

struct SelfAssessment {
  bool known = false;
};

using Submission = std::variant<SelectedOption, SelectedOptions, BlankAnswers, PairAssignments,
                                SequenceAnswer, TruthAnswer, NumericAnswer, FreeTextAnswer,
                                SpanSelection, SelfAssessment>;

inline std::string submission_kind(const Submission& submission) {
  static const char* const kinds[] = {"option", "options", "blanks", "pairs",  "sequence",
                                      "truth",  "number",  "text",   "spans",  "self_assessment"};
  return kinds[submission.index()];
}

struct EvaluationResult {
  bool correct = false;
  double score = 0.0;
  Submission canonical_answer;
  std::string canonical_display;
  std::uint64_t time_spent_ms = 0;
};

// --- Scheduling ---

struct SchedulingRecord {
  std::string item_id;
  double ease_factor = 2.5;
  int repetition_count = 0;
  int interval_days = 0;
  TimestampMs next_due_at = 0;
  std::optional<TimestampMs> last_reviewed_at;
  int total_reviews = 0;
  int lapse_count = 0;
  std::optional<int> last_quality;
  double average_accuracy = 0.0; // share of passing reviews, 0..1
  double average_time_ms = 0.0;
};

using RecordMap = std::unordered_map<std::string, SchedulingRecord>;

// --- Sessions ---

struct SessionConfiguration {
  std::string topic_id;
  std::vector<std::string> learning_path_ids;
  int target_count = 10;
  bool include_review = true;
};

enum class SessionStatus {
  NotStarted,
  InProgress,
  Completed,
  Cancelled
};

inline std::string to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::NotStarted: return "not_started";
    case SessionStatus::InProgress: return "in_progress";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::Cancelled: return "cancelled";
  }
  return "not_started";
}

inline SessionStatus session_status_from_string(const std::string& value) {
  if (value == "not_started") {
    return SessionStatus::NotStarted;
  }
  if (value == "in_progress") {
    return SessionStatus::InProgress;
  }
  if (value == "completed") {
    return SessionStatus::Completed;
  }
  if (value == "cancelled") {
    return SessionStatus::Cancelled;
  }
  throw std::invalid_argument("Unknown session status: " + value);
}

// Per-task micro-state inside InProgress. "Advanced" is transient and never observed.
enum class TaskPhase {
  Presented,
  Answered
};

inline std::string to_string(TaskPhase phase) {
  return phase == TaskPhase::Answered ? "answered" : "presented";
}

inline TaskPhase task_phase_from_string(const std::string& value) {
  if (value == "presented") {
    return TaskPhase::Presented;
  }
  if (value == "answered") {
    return TaskPhase::Answered;
  }
  throw std::invalid_argument("Unknown task phase: " + value);
}

struct VariantBreakdown {
  int attempted = 0;
  int correct = 0;
  std::int64_t total_time_ms = 0;
  double score_sum = 0.0;

  double accuracy() const {
    return attempted > 0 ? static_cast<double>(correct) / static_cast<double>(attempted) : 0.0;
  }
  double average_score() const {
    return attempted > 0 ? score_sum / static_cast<double>(attempted) : 0.0;
  }
};

struct SessionExecution {
  std::vector<std::string> task_ids;
  std::size_t cursor = 0;
  TaskPhase phase = TaskPhase::Presented;
  int completed_count = 0;
  int correct_count = 0;
  int skipped_count = 0;
  int hints_used = 0;
  std::int64_t total_time_ms = 0;
  SessionStatus status = SessionStatus::NotStarted;
  std::optional<TimestampMs> started_at;
  std::optional<TimestampMs> completed_at;
  std::optional<TimestampMs> presented_at;
  std::map<Variant, VariantBreakdown> variant_stats;
};

struct SessionResults {
  double accuracy = 0.0;
  double average_time_ms = 0.0;
  std::map<Variant, VariantBreakdown> by_variant;
};

struct PracticeSession {
  std::string id;
  SessionConfiguration configuration;
  SessionExecution execution;
  SessionResults results;
  std::uint64_t version = 0; // 0 = never persisted
};

} // namespace recall
