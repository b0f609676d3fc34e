#include "arrangement.hpp"

#include <algorithm>

namespace recall::graders {

Grade grade(const MatchingPayload& payload, const PairAssignments& submission) {
  std::size_t hits = 0;
  for (const auto& pair : payload.pairs) {
    auto it = submission.pairs.find(pair.left_id);
    if (it != submission.pairs.end() && it->second == pair.right_id) {
      ++hits;
    }
  }
  return proportional(hits, payload.pairs.size());
}

PairAssignments canonical_submission(const MatchingPayload& payload) {
  PairAssignments assignments;
  for (const auto& pair : payload.pairs) {
    assignments.pairs[pair.left_id] = pair.right_id;
  }
  return assignments;
}

std::string describe_answer(const MatchingPayload& payload) {
  std::vector<std::string> parts;
  parts.reserve(payload.pairs.size());
  for (const auto& pair : payload.pairs) {
    parts.push_back(pair.left + " = " + pair.right);
  }
  return join(parts, "; ");
}

Grade grade(const OrderingPayload& payload, const SequenceAnswer& submission) {
  return all_or_nothing(submission.order == payload.correct_order);
}

SequenceAnswer canonical_submission(const OrderingPayload& payload) {
  return SequenceAnswer{payload.correct_order};
}

std::string describe_answer(const OrderingPayload& payload) {
  std::vector<std::string> parts;
  parts.reserve(payload.correct_order.size());
  for (const auto& id : payload.correct_order) {
    auto it = std::find_if(payload.items.begin(), payload.items.end(),
                           [&](const ChoiceOption& item) { return item.id == id; });
    parts.push_back(it == payload.items.end() ? id : it->text);
  }
  return join(parts, " -> ");
}

} // namespace recall::graders
