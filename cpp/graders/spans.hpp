#pragma once

#include "common.hpp"

namespace recall::graders {

template <>
struct SubmissionFor<ErrorDetectionPayload> {
  using type = SpanSelection;
};

// F1 of the selected segment indices against the erroneous ones; correct iff the sets
// are equal. Indices past the last segment raise InvalidSubmissionShape.
Grade grade(const ErrorDetectionPayload& payload, const SpanSelection& submission);
SpanSelection canonical_submission(const ErrorDetectionPayload& payload);
std::string describe_answer(const ErrorDetectionPayload& payload);

} // namespace recall::graders
