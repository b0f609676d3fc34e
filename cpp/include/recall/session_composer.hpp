#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace recall {

enum class OrderingMode {
  Shuffled, // randomized by the caller's rng state
  ById,     // reproducibility mode
  Priority  // due: most lapses, then most overdue; new: by id
};

inline std::string to_string(OrderingMode mode) {
  switch (mode) {
    case OrderingMode::Shuffled: return "shuffled";
    case OrderingMode::ById: return "by_id";
    case OrderingMode::Priority: return "priority";
  }
  return "shuffled";
}

inline OrderingMode ordering_mode_from_string(const std::string& value) {
  if (value == "shuffled") {
    return OrderingMode::Shuffled;
  }
  if (value == "by_id") {
    return OrderingMode::ById;
  }
  if (value == "priority") {
    return OrderingMode::Priority;
  }
  throw std::invalid_argument("Unknown ordering mode: " + value);
}

struct Composition {
  std::vector<std::string> task_ids;
  std::size_t due_count = 0;
  std::size_t new_count = 0;
  int target_count = 0;

  // Fewer tasks than requested. Reported, never thrown.
  bool underflow() const {
    return task_ids.size() < static_cast<std::size_t>(target_count);
  }
};

// Due reviews first (when the configuration includes review), then new items, up to
// `config.target_count`. Throws std::invalid_argument when target_count <= 0.
Composition compose(const std::vector<ContentItem>& pool, const RecordMap& records,
                    const SessionConfiguration& config, TimestampMs now,
                    std::uint64_t& rng_state, OrderingMode ordering = OrderingMode::Shuffled);

} // namespace recall
