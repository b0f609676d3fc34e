#pragma once

#include "common.hpp"

namespace recall::graders {

template <>
struct SubmissionFor<ClozePayload> {
  using type = BlankAnswers;
};

template <>
struct SubmissionFor<TextInputPayload> {
  using type = FreeTextAnswer;
};

template <>
struct SubmissionFor<WordScramblePayload> {
  using type = FreeTextAnswer;
};

// One answer per blank, compared normalized against the answer and its alternatives.
// Throws InvalidSubmissionShape when the answer count differs from the blank count.
Grade grade(const ClozePayload& payload, const BlankAnswers& submission);
BlankAnswers canonical_submission(const ClozePayload& payload);
// The cloze text with each {{...}} marker replaced by its blank's answer.
std::string describe_answer(const ClozePayload& payload);

Grade grade(const TextInputPayload& payload, const FreeTextAnswer& submission);
FreeTextAnswer canonical_submission(const TextInputPayload& payload);
std::string describe_answer(const TextInputPayload& payload);

Grade grade(const WordScramblePayload& payload, const FreeTextAnswer& submission);
FreeTextAnswer canonical_submission(const WordScramblePayload& payload);
std::string describe_answer(const WordScramblePayload& payload);

} // namespace recall::graders
