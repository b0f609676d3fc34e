#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace recall::scheduler {

using Quality = int;

constexpr double kInitialEaseFactor = 2.5;
constexpr double kMinEaseFactor = 1.3;
constexpr double kEaseEpsilon = 1e-9;
constexpr Quality kMinQuality = 0;
constexpr Quality kMaxQuality = 5;
constexpr Quality kPassingQuality = 3;
constexpr Quality kFailingQuality = 2;
// Assumed review duration for records that have never been timed.
constexpr std::int64_t kDefaultReviewTimeMs = 30'000;

// Score thresholds for partial-credit variants: >= excellent -> 5, >= good -> 4,
// >= fair -> 3, otherwise 2.
struct QualityTable {
  double excellent = 0.9;
  double good = 0.6;
  double fair = 0.3;

  void validate() const;
};

struct SchedulerConfig {
  QualityTable quality_table{};
  std::optional<int> max_interval_days{};

  void validate() const;
};

SchedulingRecord make_initial_record(const std::string& item_id, TimestampMs now);

// SM-2 successor of `record` after a review graded `quality` at `now`. Total: qualities
// outside 0..5 are clamped and no input throws.
SchedulingRecord update(const SchedulingRecord& record, Quality quality, TimestampMs now,
                        const SchedulerConfig& config = SchedulerConfig{});

// Folds the duration of the review `update` just recorded into the running average.
SchedulingRecord record_review_time(const SchedulingRecord& reviewed, std::uint64_t time_spent_ms);

bool is_due(const SchedulingRecord& record, TimestampMs now);

Quality quality_from_score(double score, const QualityTable& table = QualityTable{});

Quality quality_for(Variant variant, const EvaluationResult& result,
                    const QualityTable& table = QualityTable{});

bool uses_partial_credit(Variant variant);

SchedulingRecord reschedule(const SchedulingRecord& record, TimestampMs new_due_at);

struct ScheduleStats {
  std::size_t total_items = 0;
  std::size_t due_now = 0;
  std::size_t graduated = 0;
  double average_interval_days = 0.0;
  double average_lapses = 0.0;
  double average_accuracy = 0.0;
};

ScheduleStats summarize(const std::vector<SchedulingRecord>& records, TimestampMs now);

struct DailyLoad {
  int day_offset = 0;
  TimestampMs window_start = 0;
  std::size_t due_count = 0;
  std::int64_t estimated_time_ms = 0;
};

// Records coming due in each of the next `days` windows of 24h starting at `now`;
// anything already overdue is counted on day 0. Each due record adds its average review
// time, or kDefaultReviewTimeMs when it has none.
std::vector<DailyLoad> review_forecast(const std::vector<SchedulingRecord>& records,
                                       TimestampMs now, int days);

} // namespace recall::scheduler
