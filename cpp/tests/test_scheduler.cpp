#include "../include/recall/scheduler.hpp"

#include "test_support.hpp"

#include <limits>
#include <vector>

using namespace recall;
using recall::testing::kT0;
using recall::testing::near;
using recall::testing::TestSuite;

namespace {

SchedulingRecord record_with(double ease, int repetition, int interval) {
  SchedulingRecord record = scheduler::make_initial_record("item", kT0);
  record.ease_factor = ease;
  record.repetition_count = repetition;
  record.interval_days = interval;
  return record;
}

void test_initial_record(TestSuite& suite) {
  auto record = scheduler::make_initial_record("apfel", kT0);
  suite.require(record.item_id == "apfel", "initial record keeps the item id");
  suite.require(near(record.ease_factor, 2.5), "initial ease is 2.5");
  suite.require(record.repetition_count == 0 && record.interval_days == 0,
                "initial record starts at repetition 0, interval 0");
  suite.require(scheduler::is_due(record, kT0), "initial record is due immediately");
  suite.require(!record.last_reviewed_at.has_value(), "initial record was never reviewed");
}

void test_first_pass(TestSuite& suite) {
  auto next = scheduler::update(record_with(2.5, 0, 0), 5, kT0);
  suite.require(near(next.ease_factor, 2.6), "first pass: ease 2.5 -> 2.6");
  suite.require(next.repetition_count == 1, "first pass: repetition 1");
  suite.require(next.interval_days == 1, "first pass: interval 1");
  suite.require(next.next_due_at == kT0 + kMillisPerDay, "first pass: due one day later");
  suite.require(next.last_reviewed_at == kT0, "first pass: last_reviewed_at is now");
  suite.require(next.total_reviews == 1 && next.lapse_count == 0, "first pass: counters");
  suite.require(next.last_quality == 5, "first pass: last quality recorded");

  auto second = scheduler::update(next, 4, kT0 + kMillisPerDay);
  suite.require(second.repetition_count == 2 && second.interval_days == 6,
                "second pass: interval 6");
  auto third = scheduler::update(second, 4, kT0 + 7 * kMillisPerDay);
  suite.require(third.interval_days == static_cast<int>(std::round(6 * third.ease_factor)),
                "third pass: interval = round(interval * new ease)");
}

void test_failure(TestSuite& suite) {
  auto next = scheduler::update(record_with(2.1, 3, 15), 1, kT0);
  suite.require(next.repetition_count == 0, "failure: repetition reset to 0");
  suite.require(next.interval_days == 1, "failure: interval reset to 1");
  suite.require(next.ease_factor < 2.1, "failure: ease reduced");
  suite.require(next.ease_factor >= scheduler::kMinEaseFactor, "failure: ease clamped >= 1.3");
  suite.require(near(next.ease_factor, 1.56), "failure: ease 2.1 - 0.54");
  suite.require(next.lapse_count == 1, "failure: lapse counted");
  suite.require(next.next_due_at == kT0 + kMillisPerDay, "failure: due tomorrow");
}

void test_ease_floor(TestSuite& suite) {
  auto record = record_with(1.3, 4, 30);
  for (int q = 0; q <= 5; ++q) {
    auto next = scheduler::update(record, q, kT0);
    suite.require(next.ease_factor >= 1.3, "ease never below 1.3 (q=" + std::to_string(q) + ")");
  }
  // Repeated failures keep hammering the floor.
  auto current = record_with(2.5, 0, 0);
  for (int i = 0; i < 20; ++i) {
    current = scheduler::update(current, 0, kT0 + i * kMillisPerDay);
    suite.require(current.ease_factor >= 1.3, "ease stays >= 1.3 under repeated failure");
  }
  suite.require(near(current.ease_factor, 1.3), "ease settles exactly on 1.3");

  auto nan_record = record_with(std::numeric_limits<double>::quiet_NaN(), 2, 6);
  auto repaired = scheduler::update(nan_record, 5, kT0);
  suite.require(std::isfinite(repaired.ease_factor) && repaired.ease_factor >= 1.3,
                "non-finite ease is repaired");
}

void test_quality_clamping(TestSuite& suite) {
  auto base = record_with(2.5, 2, 6);
  auto high = scheduler::update(base, 9, kT0);
  auto five = scheduler::update(base, 5, kT0);
  suite.require(near(high.ease_factor, five.ease_factor) && high.interval_days == five.interval_days,
                "quality above 5 behaves like 5");
  auto low = scheduler::update(base, -3, kT0);
  auto zero = scheduler::update(base, 0, kT0);
  suite.require(near(low.ease_factor, zero.ease_factor) && low.repetition_count == 0,
                "quality below 0 behaves like 0");
  suite.require(low.last_quality == 0, "clamped quality is what gets recorded");
}

void test_monotone_intervals(TestSuite& suite) {
  // Quality 4 leaves ease unchanged, so intervals must never shrink.
  auto current = record_with(2.5, 0, 0);
  int previous = 0;
  TimestampMs now = kT0;
  for (int i = 0; i < 12; ++i) {
    current = scheduler::update(current, 4, now);
    suite.require(near(current.ease_factor, 2.5), "quality 4 keeps ease fixed");
    suite.require(current.interval_days >= previous,
                  "intervals non-decreasing under passing grades at fixed ease");
    previous = current.interval_days;
    now = current.next_due_at;
  }
}

void test_interval_cap(TestSuite& suite) {
  scheduler::SchedulerConfig config;
  config.max_interval_days = 365;
  auto next = scheduler::update(record_with(2.5, 5, 300), 5, kT0, config);
  suite.require(next.interval_days == 365, "interval capped at the configured maximum");
  suite.require(next.next_due_at == kT0 + 365 * kMillisPerDay, "due date follows the capped interval");

  auto uncapped = scheduler::update(record_with(2.5, 5, 300), 5, kT0);
  suite.require(uncapped.interval_days > 365, "no cap by default");

  scheduler::SchedulerConfig bad;
  bad.max_interval_days = 0;
  suite.require(recall::testing::throws<std::invalid_argument>([&] { bad.validate(); }),
                "max_interval_days below 1 is rejected");
}

void test_quality_mapping(TestSuite& suite) {
  suite.require(scheduler::quality_from_score(1.0) == 5, "score 1.0 -> 5");
  suite.require(scheduler::quality_from_score(0.9) == 5, "score 0.9 -> 5");
  suite.require(scheduler::quality_from_score(0.75) == 4, "score 0.75 -> 4");
  suite.require(scheduler::quality_from_score(0.6) == 4, "score 0.6 -> 4");
  suite.require(scheduler::quality_from_score(1.0 / 3.0) == 3, "score 1/3 -> 3");
  suite.require(scheduler::quality_from_score(0.29) == 2, "score below 0.3 -> 2");
  suite.require(scheduler::quality_from_score(0.0) == 2, "score 0 -> 2");

  EvaluationResult right;
  right.correct = true;
  right.score = 1.0;
  EvaluationResult wrong;
  wrong.correct = false;
  wrong.score = 0.0;
  suite.require(scheduler::quality_for(Variant::MultipleChoice, right) == 5, "binary correct -> 5");
  suite.require(scheduler::quality_for(Variant::TrueFalse, wrong) == 2, "binary incorrect -> 2");
  suite.require(scheduler::quality_for(Variant::Flashcard, right) == 5, "flashcard known -> 5");
  suite.require(scheduler::quality_for(Variant::Flashcard, wrong) == 2, "flashcard unknown -> 2");

  EvaluationResult partial;
  partial.correct = false;
  partial.score = 0.75;
  suite.require(scheduler::quality_for(Variant::ClozeDeletion, partial) == 4,
                "partial-credit variants grade by score");
  suite.require(scheduler::quality_for(Variant::Ordering, partial) == 2,
                "all-or-nothing variants ignore the score");
}

void test_reschedule_and_stats(TestSuite& suite) {
  auto record = scheduler::update(record_with(2.5, 0, 0), 5, kT0);
  auto moved = scheduler::reschedule(record, kT0 + 10 * kMillisPerDay);
  suite.require(moved.next_due_at == kT0 + 10 * kMillisPerDay, "reschedule moves the due date");
  suite.require(moved.interval_days == record.interval_days &&
                    near(moved.ease_factor, record.ease_factor),
                "reschedule leaves the learning state alone");

  std::vector<SchedulingRecord> records;
  records.push_back(scheduler::make_initial_record("a", kT0 - kMillisPerDay));
  auto b = record_with(2.5, 2, 6);
  b.item_id = "b";
  b.next_due_at = kT0 + 3 * kMillisPerDay + 5;
  b.lapse_count = 2;
  b.average_accuracy = 0.5;
  b.average_time_ms = 4200.0;
  records.push_back(b);
  auto c = record_with(2.5, 1, 1);
  c.item_id = "c";
  c.next_due_at = kT0 + 30 * kMillisPerDay;
  c.average_accuracy = 1.0;
  records.push_back(c);

  auto stats = scheduler::summarize(records, kT0);
  suite.require(stats.total_items == 3, "stats: total");
  suite.require(stats.due_now == 1, "stats: one item due now");
  suite.require(stats.graduated == 1, "stats: one item at repetition >= 2");
  suite.require(near(stats.average_interval_days, 7.0 / 3.0), "stats: average interval");
  suite.require(near(stats.average_lapses, 2.0 / 3.0), "stats: average lapses");
  suite.require(near(stats.average_accuracy, 0.5), "stats: average accuracy across records");

  auto forecast = scheduler::review_forecast(records, kT0, 7);
  suite.require(forecast.size() == 7, "forecast covers the requested days");
  suite.require(forecast[0].due_count == 1, "forecast: overdue counted on day 0");
  suite.require(forecast[3].due_count == 1, "forecast: item due on day 3");
  suite.require(forecast[0].estimated_time_ms == scheduler::kDefaultReviewTimeMs,
                "forecast: untimed records assume the default review time");
  suite.require(forecast[3].estimated_time_ms == 4200, "forecast: timed records use their average");
  suite.require(forecast[1].estimated_time_ms == 0, "forecast: empty days take no time");
  std::size_t total = 0;
  for (const auto& day : forecast) {
    total += day.due_count;
  }
  suite.require(total == 2, "forecast: items beyond the window are not counted");
  suite.require(scheduler::review_forecast(records, kT0, 0).empty(), "forecast: zero days is empty");
}

void test_performance(TestSuite& suite) {
  auto record = scheduler::make_initial_record("hund", kT0);
  suite.require(near(record.average_accuracy, 0.0) && near(record.average_time_ms, 0.0),
                "performance: fresh record has no history");

  record = scheduler::record_review_time(scheduler::update(record, 5, kT0), 3000);
  suite.require(near(record.average_accuracy, 1.0), "performance: one pass -> accuracy 1");
  suite.require(near(record.average_time_ms, 3000.0), "performance: first time taken as is");

  record = scheduler::record_review_time(scheduler::update(record, 2, kT0 + kMillisPerDay), 1000);
  suite.require(near(record.average_accuracy, 0.5), "performance: a failure halves accuracy");
  suite.require(near(record.average_time_ms, 2000.0), "performance: running mean of times");

  record = scheduler::update(record, 3, kT0 + 2 * kMillisPerDay);
  suite.require(near(record.average_accuracy, 2.0 / 3.0), "performance: quality 3 passes");
  suite.require(near(record.average_time_ms, 2000.0), "performance: untimed review keeps the mean");
}

} // namespace

int main() {
  TestSuite suite;
  test_initial_record(suite);
  test_first_pass(suite);
  test_failure(suite);
  test_ease_floor(suite);
  test_quality_clamping(suite);
  test_monotone_intervals(suite);
  test_interval_cap(suite);
  test_quality_mapping(suite);
  test_reschedule_and_stats(suite);
  test_performance(suite);
  return recall::testing::finish(suite, "Scheduler");
}
