#pragma once

#include "common.hpp"

namespace recall::graders {

template <>
struct SubmissionFor<MultipleChoicePayload> {
  using type = SelectedOption;
};

template <>
struct SubmissionFor<MultiSelectPayload> {
  using type = SelectedOptions;
};

template <>
struct SubmissionFor<TrueFalsePayload> {
  using type = TruthAnswer;
};

template <>
struct SubmissionFor<FlashcardPayload> {
  using type = SelfAssessment;
};

Grade grade(const MultipleChoicePayload& payload, const SelectedOption& submission);
SelectedOption canonical_submission(const MultipleChoicePayload& payload);
std::string describe_answer(const MultipleChoicePayload& payload);

// Jaccard similarity of the selected and correct sets.
Grade grade(const MultiSelectPayload& payload, const SelectedOptions& submission);
SelectedOptions canonical_submission(const MultiSelectPayload& payload);
std::string describe_answer(const MultiSelectPayload& payload);

Grade grade(const TrueFalsePayload& payload, const TruthAnswer& submission);
TruthAnswer canonical_submission(const TrueFalsePayload& payload);
std::string describe_answer(const TrueFalsePayload& payload);

// Self-assessed: the learner's "known" flag is the verdict.
Grade grade(const FlashcardPayload& payload, const SelfAssessment& submission);
SelfAssessment canonical_submission(const FlashcardPayload& payload);
std::string describe_answer(const FlashcardPayload& payload);

} // namespace recall::graders
