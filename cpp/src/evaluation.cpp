#include "recall/evaluation.hpp"

#include "../graders/arrangement.hpp"
#include "../graders/choice.hpp"
#include "../graders/numeric.hpp"
#include "../graders/spans.hpp"
#include "../graders/text.hpp"
#include "recall/errors.hpp"

#include <type_traits>
#include <variant>

namespace recall {

EvaluationResult evaluate(const ContentItem& item, const Submission& submission,
                          std::uint64_t elapsed_ms) {
  return std::visit(
      [&](const auto& payload) -> EvaluationResult {
        using PayloadT = std::decay_t<decltype(payload)>;
        using Expected = typename graders::SubmissionFor<PayloadT>::type;

        const auto* typed = std::get_if<Expected>(&submission);
        if (!typed) {
          throw InvalidSubmissionShape(to_string(item.variant()),
                                       "expected '" + expected_submission_kind(item.variant()) +
                                           "' submission, got '" +
                                           submission_kind(submission) + "'");
        }

        const graders::Grade grade = graders::grade(payload, *typed);
        EvaluationResult result;
        result.correct = grade.correct;
        result.score = detail::clip01(grade.score);
        result.canonical_answer = graders::canonical_submission(payload);
        result.canonical_display = graders::describe_answer(payload);
        result.time_spent_ms = elapsed_ms;
        return result;
      },
      item.payload);
}

Submission canonical_answer(const ContentItem& item) {
  return std::visit(
      [](const auto& payload) -> Submission { return graders::canonical_submission(payload); },
      item.payload);
}

std::string expected_submission_kind(Variant variant) {
  switch (variant) {
    case Variant::MultipleChoice: return "option";
    case Variant::MultiSelect: return "options";
    case Variant::ClozeDeletion: return "blanks";
    case Variant::Matching: return "pairs";
    case Variant::Ordering: return "sequence";
    case Variant::TrueFalse: return "truth";
    case Variant::Slider: return "number";
    case Variant::TextInput:
    case Variant::WordScramble: return "text";
    case Variant::ErrorDetection: return "spans";
    case Variant::Flashcard: return "self_assessment";
  }
  return "option";
}

} // namespace recall
