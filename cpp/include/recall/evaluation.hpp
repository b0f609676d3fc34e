#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>

namespace recall {

// Grades `submission` against `item`. Pure: same inputs, same result. Throws
// InvalidSubmissionShape when the submission kind does not belong to the item's variant
// or its contents cannot be graded (wrong blank count, span index out of range).
EvaluationResult evaluate(const ContentItem& item, const Submission& submission,
                          std::uint64_t elapsed_ms);

// The submission that `evaluate` grades as fully correct.
Submission canonical_answer(const ContentItem& item);

// Submission kind accepted by `variant` ("option", "blanks", ...).
std::string expected_submission_kind(Variant variant);

} // namespace recall
