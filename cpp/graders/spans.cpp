#include "spans.hpp"

#include <algorithm>
#include <iterator>

namespace recall::graders {

Grade grade(const ErrorDetectionPayload& payload, const SpanSelection& submission) {
  for (std::size_t index : submission.indices) {
    if (index >= payload.segments.size()) {
      throw InvalidSubmissionShape(to_string(Variant::ErrorDetection),
                                   "segment index " + std::to_string(index) +
                                       " out of range (" +
                                       std::to_string(payload.segments.size()) + " segments)");
    }
  }

  const auto& expected = payload.error_indices;
  const auto& selected = submission.indices;
  if (expected.empty() || selected.empty()) {
    return all_or_nothing(expected.empty() && selected.empty());
  }

  std::vector<std::size_t> hits;
  std::set_intersection(expected.begin(), expected.end(), selected.begin(), selected.end(),
                        std::back_inserter(hits));
  const double tp = static_cast<double>(hits.size());
  const double precision = tp / static_cast<double>(selected.size());
  const double recall = tp / static_cast<double>(expected.size());
  const double f1 = (precision + recall) > 0.0 ? 2.0 * precision * recall / (precision + recall)
                                               : 0.0;
  return Grade{detail::clip01(f1), expected == selected};
}

SpanSelection canonical_submission(const ErrorDetectionPayload& payload) {
  return SpanSelection{payload.error_indices};
}

std::string describe_answer(const ErrorDetectionPayload& payload) {
  if (payload.error_indices.empty()) {
    return "no errors";
  }
  std::vector<std::string> parts;
  for (std::size_t index : payload.error_indices) {
    parts.push_back(index < payload.segments.size() ? payload.segments[index]
                                                    : "#" + std::to_string(index));
  }
  return join(parts, ", ");
}

} // namespace recall::graders
