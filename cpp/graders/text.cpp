#include "text.hpp"

namespace recall::graders {
namespace {

bool blank_matches(const ClozeBlank& blank, const std::string& given) {
  const std::string normalized = normalize_text(given);
  if (normalized == normalize_text(blank.answer)) {
    return true;
  }
  for (const auto& alternative : blank.alternatives) {
    if (normalized == normalize_text(alternative)) {
      return true;
    }
  }
  return false;
}

} // namespace

Grade grade(const ClozePayload& payload, const BlankAnswers& submission) {
  if (submission.blanks.size() != payload.blanks.size()) {
    throw InvalidSubmissionShape(to_string(Variant::ClozeDeletion),
                                 "expected " + std::to_string(payload.blanks.size()) +
                                     " blank answers, got " +
                                     std::to_string(submission.blanks.size()));
  }
  std::size_t hits = 0;
  for (std::size_t i = 0; i < payload.blanks.size(); ++i) {
    if (blank_matches(payload.blanks[i], submission.blanks[i])) {
      ++hits;
    }
  }
  return proportional(hits, payload.blanks.size());
}

BlankAnswers canonical_submission(const ClozePayload& payload) {
  BlankAnswers answers;
  answers.blanks.reserve(payload.blanks.size());
  for (const auto& blank : payload.blanks) {
    answers.blanks.push_back(blank.answer);
  }
  return answers;
}

std::string describe_answer(const ClozePayload& payload) {
  std::string out;
  std::size_t pos = 0;
  std::size_t blank = 0;
  while (pos < payload.text.size()) {
    const std::size_t open = payload.text.find("{{", pos);
    if (open == std::string::npos) {
      break;
    }
    const std::size_t close = payload.text.find("}}", open + 2);
    if (close == std::string::npos) {
      break;
    }
    out.append(payload.text, pos, open - pos);
    if (blank < payload.blanks.size()) {
      out.append(payload.blanks[blank].answer);
    } else {
      out.append(payload.text, open, close + 2 - open);
    }
    ++blank;
    pos = close + 2;
  }
  if (pos < payload.text.size()) {
    out.append(payload.text, pos, std::string::npos);
  }
  if (blank == 0 && !payload.blanks.empty()) {
    // Text without markers: list the answers instead.
    std::vector<std::string> parts;
    for (const auto& entry : payload.blanks) {
      parts.push_back(entry.answer);
    }
    return join(parts, ", ");
  }
  return out;
}

Grade grade(const TextInputPayload& payload, const FreeTextAnswer& submission) {
  const std::string given =
      payload.case_sensitive ? trim_text(submission.text) : normalize_text(submission.text);
  for (const auto& accepted : payload.accepted) {
    const std::string expected =
        payload.case_sensitive ? trim_text(accepted) : normalize_text(accepted);
    if (given == expected) {
      return all_or_nothing(true);
    }
  }
  return all_or_nothing(false);
}

FreeTextAnswer canonical_submission(const TextInputPayload& payload) {
  return FreeTextAnswer{payload.accepted.empty() ? std::string{} : payload.accepted.front()};
}

std::string describe_answer(const TextInputPayload& payload) {
  return payload.accepted.empty() ? std::string{} : payload.accepted.front();
}

Grade grade(const WordScramblePayload& payload, const FreeTextAnswer& submission) {
  return all_or_nothing(normalize_text(submission.text) == normalize_text(payload.target));
}

FreeTextAnswer canonical_submission(const WordScramblePayload& payload) {
  return FreeTextAnswer{payload.target};
}

std::string describe_answer(const WordScramblePayload& payload) {
  return payload.target;
}

} // namespace recall::graders
