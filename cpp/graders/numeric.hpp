#pragma once

#include "common.hpp"

namespace recall::graders {

template <>
struct SubmissionFor<SliderPayload> {
  using type = NumericAnswer;
};

// Correct when |value - target| <= tolerance. Non-finite values are wrong, never an error.
Grade grade(const SliderPayload& payload, const NumericAnswer& submission);
NumericAnswer canonical_submission(const SliderPayload& payload);
std::string describe_answer(const SliderPayload& payload);

} // namespace recall::graders
