#pragma once

#include "common.hpp"

namespace recall::graders {

template <>
struct SubmissionFor<MatchingPayload> {
  using type = PairAssignments;
};

template <>
struct SubmissionFor<OrderingPayload> {
  using type = SequenceAnswer;
};

// Fraction of left ids assigned to their own right id. Assignments for unknown left
// ids earn nothing.
Grade grade(const MatchingPayload& payload, const PairAssignments& submission);
PairAssignments canonical_submission(const MatchingPayload& payload);
std::string describe_answer(const MatchingPayload& payload);

Grade grade(const OrderingPayload& payload, const SequenceAnswer& submission);
SequenceAnswer canonical_submission(const OrderingPayload& payload);
std::string describe_answer(const OrderingPayload& payload);

} // namespace recall::graders
