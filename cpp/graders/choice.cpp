#include "choice.hpp"

#include <algorithm>
#include <iterator>

namespace recall::graders {
namespace {

std::string option_text(const std::vector<ChoiceOption>& options, const std::string& id) {
  auto it = std::find_if(options.begin(), options.end(),
                         [&](const ChoiceOption& option) { return option.id == id; });
  return it == options.end() ? id : it->text;
}

} // namespace

Grade grade(const MultipleChoicePayload& payload, const SelectedOption& submission) {
  return all_or_nothing(submission.option_id == payload.correct_option_id);
}

SelectedOption canonical_submission(const MultipleChoicePayload& payload) {
  return SelectedOption{payload.correct_option_id};
}

std::string describe_answer(const MultipleChoicePayload& payload) {
  return option_text(payload.options, payload.correct_option_id);
}

Grade grade(const MultiSelectPayload& payload, const SelectedOptions& submission) {
  const auto& expected = payload.correct_option_ids;
  const auto& selected = submission.option_ids;

  std::vector<std::string> both;
  std::set_intersection(expected.begin(), expected.end(), selected.begin(), selected.end(),
                        std::back_inserter(both));
  const std::size_t union_size = expected.size() + selected.size() - both.size();
  if (union_size == 0) {
    return Grade{1.0, true};
  }
  const double score = static_cast<double>(both.size()) / static_cast<double>(union_size);
  return Grade{detail::clip01(score), both.size() == union_size};
}

SelectedOptions canonical_submission(const MultiSelectPayload& payload) {
  return SelectedOptions{payload.correct_option_ids};
}

std::string describe_answer(const MultiSelectPayload& payload) {
  // Presentation order, not id order.
  std::vector<std::string> parts;
  for (const auto& option : payload.options) {
    if (payload.correct_option_ids.count(option.id) > 0) {
      parts.push_back(option.text);
    }
  }
  for (const auto& id : payload.correct_option_ids) {
    auto listed = std::find_if(payload.options.begin(), payload.options.end(),
                               [&](const ChoiceOption& option) { return option.id == id; });
    if (listed == payload.options.end()) {
      parts.push_back(id);
    }
  }
  return join(parts, ", ");
}

Grade grade(const TrueFalsePayload& payload, const TruthAnswer& submission) {
  return all_or_nothing(submission.value == payload.answer);
}

TruthAnswer canonical_submission(const TrueFalsePayload& payload) {
  return TruthAnswer{payload.answer};
}

std::string describe_answer(const TrueFalsePayload& payload) {
  return payload.answer ? "true" : "false";
}

Grade grade(const FlashcardPayload& /*payload*/, const SelfAssessment& submission) {
  return all_or_nothing(submission.known);
}

SelfAssessment canonical_submission(const FlashcardPayload& /*payload*/) {
  return SelfAssessment{true};
}

std::string describe_answer(const FlashcardPayload& payload) {
  return payload.back;
}

} // namespace recall::graders
