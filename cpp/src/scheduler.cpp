#include "recall/scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace recall::scheduler {
namespace {

// Largest interval whose day offset still fits a millisecond timestamp comfortably.
constexpr double kIntervalCeiling = 1'000'000.0;

int next_interval(const SchedulingRecord& record, int repetition, double ease_factor) {
  if (repetition == 1) {
    return 1;
  }
  if (repetition == 2) {
    return 6;
  }
  const double raw = std::round(static_cast<double>(record.interval_days) * ease_factor);
  if (!(raw >= 1.0)) {
    return 1;
  }
  return static_cast<int>(std::min(raw, kIntervalCeiling));
}

} // namespace

void QualityTable::validate() const {
  if (!(fair >= 0.0 && fair <= good && good <= excellent && excellent <= 1.0)) {
    throw std::invalid_argument("quality table must satisfy 0 <= fair <= good <= excellent <= 1");
  }
}

void SchedulerConfig::validate() const {
  quality_table.validate();
  if (max_interval_days.has_value() && max_interval_days.value() < 1) {
    throw std::invalid_argument("max_interval_days must be at least 1");
  }
}

SchedulingRecord make_initial_record(const std::string& item_id, TimestampMs now) {
  SchedulingRecord record;
  record.item_id = item_id;
  record.ease_factor = kInitialEaseFactor;
  record.repetition_count = 0;
  record.interval_days = 0;
  record.next_due_at = now;
  return record;
}

SchedulingRecord update(const SchedulingRecord& record, Quality quality, TimestampMs now,
                        const SchedulerConfig& config) {
  const Quality q = std::clamp(quality, kMinQuality, kMaxQuality);
  const double miss = static_cast<double>(kMaxQuality - q);

  double ease = record.ease_factor;
  if (!std::isfinite(ease)) {
    ease = kInitialEaseFactor;
  }
  ease += 0.1 - miss * (0.08 + miss * 0.02);
  if (ease < kMinEaseFactor + kEaseEpsilon) {
    ease = kMinEaseFactor;
  }

  SchedulingRecord next = record;
  next.ease_factor = ease;
  const int previous_reviews = std::max(record.total_reviews, 0);
  next.total_reviews = previous_reviews + 1;
  const double passed = q >= kPassingQuality ? 1.0 : 0.0;
  next.average_accuracy =
      (record.average_accuracy * previous_reviews + passed) / next.total_reviews;
  next.last_reviewed_at = now;
  next.last_quality = q;

  if (q < kPassingQuality) {
    next.repetition_count = 0;
    next.interval_days = 1;
    next.lapse_count = record.lapse_count + 1;
  } else {
    next.repetition_count = std::max(record.repetition_count, 0) + 1;
    next.interval_days = next_interval(record, next.repetition_count, ease);
  }

  if (config.max_interval_days.has_value()) {
    next.interval_days = std::min(next.interval_days, std::max(1, *config.max_interval_days));
  }

  next.next_due_at = now + static_cast<TimestampMs>(next.interval_days) * kMillisPerDay;
  return next;
}

SchedulingRecord record_review_time(const SchedulingRecord& reviewed,
                                    std::uint64_t time_spent_ms) {
  SchedulingRecord next = reviewed;
  const double n = static_cast<double>(std::max(reviewed.total_reviews, 1));
  next.average_time_ms += (static_cast<double>(time_spent_ms) - reviewed.average_time_ms) / n;
  return next;
}

bool is_due(const SchedulingRecord& record, TimestampMs now) {
  return record.next_due_at <= now;
}

Quality quality_from_score(double score, const QualityTable& table) {
  if (!(score >= table.fair)) {
    return kFailingQuality;
  }
  if (score >= table.excellent) {
    return 5;
  }
  if (score >= table.good) {
    return 4;
  }
  return 3;
}

bool uses_partial_credit(Variant variant) {
  switch (variant) {
    case Variant::MultiSelect:
    case Variant::ClozeDeletion:
    case Variant::Matching:
    case Variant::ErrorDetection:
      return true;
    case Variant::MultipleChoice:
    case Variant::Ordering:
    case Variant::TrueFalse:
    case Variant::Slider:
    case Variant::TextInput:
    case Variant::WordScramble:
    case Variant::Flashcard:
      return false;
  }
  return false;
}

Quality quality_for(Variant variant, const EvaluationResult& result, const QualityTable& table) {
  if (uses_partial_credit(variant)) {
    return quality_from_score(result.score, table);
  }
  return result.correct ? kMaxQuality : kFailingQuality;
}

SchedulingRecord reschedule(const SchedulingRecord& record, TimestampMs new_due_at) {
  SchedulingRecord next = record;
  next.next_due_at = new_due_at;
  return next;
}

ScheduleStats summarize(const std::vector<SchedulingRecord>& records, TimestampMs now) {
  ScheduleStats stats;
  stats.total_items = records.size();
  if (records.empty()) {
    return stats;
  }
  double interval_sum = 0.0;
  double lapse_sum = 0.0;
  double accuracy_sum = 0.0;
  for (const auto& record : records) {
    if (is_due(record, now)) {
      ++stats.due_now;
    }
    if (record.repetition_count >= 2) {
      ++stats.graduated;
    }
    interval_sum += static_cast<double>(record.interval_days);
    lapse_sum += static_cast<double>(record.lapse_count);
    accuracy_sum += record.average_accuracy;
  }
  const double n = static_cast<double>(records.size());
  stats.average_interval_days = interval_sum / n;
  stats.average_lapses = lapse_sum / n;
  stats.average_accuracy = accuracy_sum / n;
  return stats;
}

std::vector<DailyLoad> review_forecast(const std::vector<SchedulingRecord>& records,
                                       TimestampMs now, int days) {
  std::vector<DailyLoad> forecast;
  if (days <= 0) {
    return forecast;
  }
  forecast.reserve(static_cast<std::size_t>(days));
  for (int day = 0; day < days; ++day) {
    DailyLoad load;
    load.day_offset = day;
    load.window_start = now + static_cast<TimestampMs>(day) * kMillisPerDay;
    forecast.push_back(load);
  }
  for (const auto& record : records) {
    std::size_t day = 0;
    if (record.next_due_at >= now + kMillisPerDay) {
      const TimestampMs offset = (record.next_due_at - now) / kMillisPerDay;
      if (offset >= static_cast<TimestampMs>(days)) {
        continue;
      }
      day = static_cast<std::size_t>(offset);
    }
    DailyLoad& load = forecast[day];
    ++load.due_count;
    load.estimated_time_ms += record.average_time_ms > 0.0
                                  ? static_cast<std::int64_t>(std::llround(record.average_time_ms))
                                  : kDefaultReviewTimeMs;
  }
  return forecast;
}

} // namespace recall::scheduler
