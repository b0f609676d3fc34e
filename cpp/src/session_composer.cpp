#include "recall/session_composer.hpp"

#include "recall/scheduler.hpp"
#include "rng.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace recall {
namespace {

struct Candidate {
  std::string id;
  const SchedulingRecord* record = nullptr;
};

bool by_id(const Candidate& a, const Candidate& b) {
  return a.id < b.id;
}

bool by_priority(const Candidate& a, const Candidate& b) {
  const int lapses_a = a.record ? a.record->lapse_count : 0;
  const int lapses_b = b.record ? b.record->lapse_count : 0;
  if (lapses_a != lapses_b) {
    return lapses_a > lapses_b;
  }
  const TimestampMs due_a = a.record ? a.record->next_due_at : 0;
  const TimestampMs due_b = b.record ? b.record->next_due_at : 0;
  if (due_a != due_b) {
    return due_a < due_b;
  }
  return a.id < b.id;
}

void order_partition(std::vector<Candidate>& partition, OrderingMode ordering, bool due,
                     std::uint64_t& rng_state) {
  // Sorting first makes the shuffle independent of the pool's incoming order.
  std::sort(partition.begin(), partition.end(), by_id);
  switch (ordering) {
    case OrderingMode::ById:
      break;
    case OrderingMode::Shuffled:
      shuffle_with(partition, rng_state);
      break;
    case OrderingMode::Priority:
      if (due) {
        std::stable_sort(partition.begin(), partition.end(), by_priority);
      }
      break;
  }
}

} // namespace

Composition compose(const std::vector<ContentItem>& pool, const RecordMap& records,
                    const SessionConfiguration& config, TimestampMs now,
                    std::uint64_t& rng_state, OrderingMode ordering) {
  if (config.target_count <= 0) {
    throw std::invalid_argument("compose: target_count must be positive, got " +
                                std::to_string(config.target_count));
  }

  Composition composition;
  composition.target_count = config.target_count;
  if (pool.empty()) {
    return composition;
  }

  std::vector<Candidate> due;
  std::vector<Candidate> fresh;
  std::unordered_set<std::string> seen;
  for (const auto& item : pool) {
    if (!seen.insert(item.id).second) {
      continue;
    }
    auto it = records.find(item.id);
    const SchedulingRecord* record = it == records.end() ? nullptr : &it->second;
    if (record && config.include_review && scheduler::is_due(*record, now)) {
      due.push_back({item.id, record});
    } else if (!record || record->repetition_count == 0) {
      fresh.push_back({item.id, record});
    }
  }

  order_partition(due, ordering, true, rng_state);
  order_partition(fresh, ordering, false, rng_state);

  const auto target = static_cast<std::size_t>(config.target_count);
  composition.task_ids.reserve(std::min(target, due.size() + fresh.size()));
  for (const auto& candidate : due) {
    if (composition.task_ids.size() >= target) {
      break;
    }
    composition.task_ids.push_back(candidate.id);
    ++composition.due_count;
  }
  for (const auto& candidate : fresh) {
    if (composition.task_ids.size() >= target) {
      break;
    }
    composition.task_ids.push_back(candidate.id);
    ++composition.new_count;
  }
  return composition;
}

} // namespace recall
