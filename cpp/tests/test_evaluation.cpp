#include "../include/recall/errors.hpp"
#include "../include/recall/evaluation.hpp"
#include "../graders/common.hpp"

#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <variant>

using namespace recall;
using namespace recall::testing;

namespace {

void test_canonical_answers(TestSuite& suite) {
  for (const auto& item : one_of_each_variant()) {
    const auto canonical = canonical_answer(item);
    const auto result = evaluate(item, canonical, 1200);
    const std::string label = to_string(item.variant());
    suite.require(result.correct, label + ": canonical answer is correct");
    suite.require(near(result.score, 1.0), label + ": canonical answer scores 1.0");
    suite.require(result.canonical_answer.index() == canonical.index(),
                  label + ": result carries the canonical answer");
    suite.require(!result.canonical_display.empty(), label + ": canonical display is filled");
    suite.require(result.time_spent_ms == 1200, label + ": elapsed time recorded");
    suite.require(submission_kind(canonical) == expected_submission_kind(item.variant()),
                  label + ": canonical submission has the expected kind");
  }
}

void test_shape_mismatch(TestSuite& suite) {
  const auto items = one_of_each_variant();
  for (const auto& item : items) {
    // A truth answer fits only the true/false variant.
    if (item.variant() == Variant::TrueFalse) {
      suite.require(throws<InvalidSubmissionShape>(
                        [&] { evaluate(item, SelfAssessment{true}, 0); }),
                    "true-false rejects a self assessment");
      continue;
    }
    suite.require(throws<InvalidSubmissionShape>([&] { evaluate(item, TruthAnswer{true}, 0); }),
                  to_string(item.variant()) + " rejects a truth answer");
  }
  suite.require(throws<InvalidSubmissionShape>(
                    [&] { evaluate(cloze_item("c"), BlankAnswers{{"bin", "bist"}}, 0); }),
                "cloze rejects the wrong number of blanks");
  suite.require(throws<InvalidSubmissionShape>(
                    [&] { evaluate(error_detection_item("e"), SpanSelection{{2, 6}}, 0); }),
                "error detection rejects an out-of-range index");
}

void test_multiple_choice(TestSuite& suite) {
  auto item = multiple_choice_item("mc");
  suite.require(evaluate(item, SelectedOption{"c"}, 0).correct, "multiple choice: right id");
  auto wrong = evaluate(item, SelectedOption{"a"}, 0);
  suite.require(!wrong.correct && near(wrong.score, 0.0), "multiple choice: wrong id scores 0");
  suite.require(wrong.canonical_display == "das", "multiple choice: display uses option text");
}

void test_multi_select(TestSuite& suite) {
  auto item = multi_select_item("ms");
  auto result = evaluate(item, SelectedOptions{{"A", "B"}}, 0);
  suite.require(near(result.score, 1.0 / 3.0), "multi-select {A,C} vs {A,B}: Jaccard 1/3");
  suite.require(!result.correct, "multi-select partial is not correct");

  auto superset = evaluate(item, SelectedOptions{{"A", "B", "C"}}, 0);
  suite.require(near(superset.score, 2.0 / 3.0) && !superset.correct,
                "multi-select superset is penalized");
  auto none = evaluate(item, SelectedOptions{}, 0);
  suite.require(near(none.score, 0.0), "multi-select empty selection scores 0");

  MultiSelectPayload empty_truth;
  empty_truth.options = {{"A", "a"}};
  auto empty_item = make_item("ms-empty", empty_truth);
  auto both_empty = evaluate(empty_item, SelectedOptions{}, 0);
  suite.require(both_empty.correct && near(both_empty.score, 1.0),
                "multi-select: empty truth and empty selection is perfect");
}

void test_cloze(TestSuite& suite) {
  auto item = cloze_item("cl");
  auto partial = evaluate(item, BlankAnswers{{"bin", " BIST ", "ist", "seid"}}, 0);
  suite.require(near(partial.score, 0.75), "cloze: 3 of 4 blanks scores 0.75");
  suite.require(!partial.correct, "cloze: partial is not correct");
  suite.require(partial.canonical_display ==
                    "Ich bin müde, du bist wach, er ist hier, wir sind da.",
                "cloze: display fills the blanks");

  ClozePayload alt;
  alt.text = "Die {{Straße}} ist lang.";
  alt.blanks = {{"Straße", {"Strasse"}}};
  auto alt_item = make_item("cl-alt", alt);
  suite.require(evaluate(alt_item, BlankAnswers{{"strasse"}}, 0).correct,
                "cloze: alternatives are accepted");
  suite.require(evaluate(alt_item, BlankAnswers{{"STRASSE "}}, 0).correct,
                "cloze: alternatives are normalized too");
}

void test_matching(TestSuite& suite) {
  auto item = matching_item("mt");
  PairAssignments half;
  half.pairs = {{"l1", "r1"}, {"l2", "r3"}, {"l3", "r2"}, {"l4", "r4"}};
  auto result = evaluate(item, half, 0);
  suite.require(near(result.score, 0.5) && !result.correct, "matching: 2 of 4 pairs scores 0.5");

  PairAssignments extra = std::get<PairAssignments>(canonical_answer(item));
  extra.pairs["l9"] = "r9";
  suite.require(evaluate(item, extra, 0).correct, "matching: unknown left ids are ignored");
}

void test_ordering(TestSuite& suite) {
  auto item = ordering_item("or");
  suite.require(evaluate(item, SequenceAnswer{{"w1", "w2", "w3"}}, 0).correct, "ordering: exact");
  auto swapped = evaluate(item, SequenceAnswer{{"w1", "w3", "w2"}}, 0);
  suite.require(!swapped.correct && near(swapped.score, 0.0), "ordering: no partial credit");
  suite.require(!evaluate(item, SequenceAnswer{{"w1", "w2"}}, 0).correct,
                "ordering: short sequence is wrong");
  suite.require(evaluate(item, canonical_answer(item), 0).canonical_display == "Ich -> bin -> hier",
                "ordering: display follows the correct order");
}

void test_true_false_and_flashcard(TestSuite& suite) {
  auto tf = true_false_item("tf");
  suite.require(evaluate(tf, TruthAnswer{true}, 0).correct, "true-false: match");
  suite.require(!evaluate(tf, TruthAnswer{false}, 0).correct, "true-false: mismatch");

  auto card = flashcard_item("fc");
  suite.require(evaluate(card, SelfAssessment{true}, 0).correct, "flashcard: known is correct");
  auto unknown = evaluate(card, SelfAssessment{false}, 0);
  suite.require(!unknown.correct && near(unknown.score, 0.0), "flashcard: unknown is incorrect");
  suite.require(unknown.canonical_display == "the apple", "flashcard: display shows the back");
}

void test_slider(TestSuite& suite) {
  SliderPayload p;
  p.target = 0.3;
  p.tolerance = 0.1;
  p.unit = "kg";
  auto item = make_item("sl", p);
  suite.require(evaluate(item, NumericAnswer{0.2}, 0).correct, "slider: lower tolerance edge");
  suite.require(evaluate(item, NumericAnswer{0.4}, 0).correct, "slider: upper tolerance edge");
  suite.require(!evaluate(item, NumericAnswer{0.45}, 0).correct, "slider: outside tolerance");
  suite.require(!evaluate(item, NumericAnswer{std::numeric_limits<double>::quiet_NaN()}, 0).correct,
                "slider: NaN is wrong");
  suite.require(evaluate(item, NumericAnswer{0.3}, 0).canonical_display == "0.3 kg",
                "slider: display includes the unit");

  auto exact = slider_item("sl-exact");
  suite.require(evaluate(exact, NumericAnswer{4}, 0).correct, "slider: zero tolerance exact hit");
  suite.require(!evaluate(exact, NumericAnswer{5}, 0).correct, "slider: zero tolerance miss");
}

void test_text_input(TestSuite& suite) {
  auto item = text_input_item("ti");
  suite.require(evaluate(item, FreeTextAnswer{"  STRASSE\t"}, 0).correct,
                "text input: trims and folds case");
  suite.require(evaluate(item, FreeTextAnswer{"STRAẞE"}, 0).correct,
                "text input: capital sharp s folds to ss");
  suite.require(!evaluate(item, FreeTextAnswer{"Stra sse"}, 0).correct,
                "text input: internal whitespace matters");

  TextInputPayload strict;
  strict.accepted = {"Berlin"};
  strict.case_sensitive = true;
  auto strict_item = make_item("ti-strict", strict);
  suite.require(evaluate(strict_item, FreeTextAnswer{" Berlin "}, 0).correct,
                "text input: case sensitive still trims");
  suite.require(!evaluate(strict_item, FreeTextAnswer{"berlin"}, 0).correct,
                "text input: case sensitive compares case");

  TextInputPayload greek;
  greek.accepted = {"ΚΑΛΗΜΈΡΑ"};
  suite.require(evaluate(make_item("ti-el", greek), FreeTextAnswer{"καλημέρα"}, 0).correct,
                "text input: Greek case folding");
  TextInputPayload cyrillic;
  cyrillic.accepted = {"Привет"};
  suite.require(evaluate(make_item("ti-ru", cyrillic), FreeTextAnswer{"ПРИВЕТ"}, 0).correct,
                "text input: Cyrillic case folding");
  TextInputPayload spanish;
  spanish.accepted = {"Mañana"};
  suite.require(evaluate(make_item("ti-es", spanish), FreeTextAnswer{" MAÑANA"}, 0).correct,
                "text input: Latin-1 folding and no-break space trim");
}

void test_word_scramble(TestSuite& suite) {
  auto item = word_scramble_item("ws");
  suite.require(evaluate(item, FreeTextAnswer{"hund"}, 0).correct, "word scramble: normalized match");
  suite.require(!evaluate(item, FreeTextAnswer{"dnuH"}, 0).correct, "word scramble: scrambled is wrong");
}

void test_error_detection(TestSuite& suite) {
  ErrorDetectionPayload p;
  p.segments = {"a", "b", "c", "d", "e"};
  p.error_indices = {1, 3};
  auto item = make_item("ed", p);

  auto exact = evaluate(item, SpanSelection{{1, 3}}, 0);
  suite.require(exact.correct && near(exact.score, 1.0), "error detection: exact sets");
  auto half = evaluate(item, SpanSelection{{1}}, 0);
  suite.require(near(half.score, 2.0 / 3.0) && !half.correct, "error detection: F1 with one miss");
  auto noisy = evaluate(item, SpanSelection{{1, 2, 3, 4}}, 0);
  suite.require(near(noisy.score, 2.0 / 3.0), "error detection: F1 with false positives");
  auto none = evaluate(item, SpanSelection{}, 0);
  suite.require(near(none.score, 0.0) && !none.correct, "error detection: empty selection");

  ErrorDetectionPayload clean;
  clean.segments = {"Alles", "gut"};
  auto clean_item = make_item("ed-clean", clean);
  suite.require(evaluate(clean_item, SpanSelection{}, 0).correct,
                "error detection: no errors and nothing selected is correct");
  auto false_alarm = evaluate(clean_item, SpanSelection{{0}}, 0);
  suite.require(!false_alarm.correct && near(false_alarm.score, 0.0),
                "error detection: selecting in a clean text scores 0");
}

void test_normalization(TestSuite& suite) {
  suite.require(graders::normalize_text("  Äpfel ") == "äpfel", "normalize: trim and fold umlaut");
  suite.require(graders::normalize_text("Fuß") == "fuss", "normalize: sharp s expands");
  suite.require(graders::normalize_text("ŁÓDŹ") == "łódź", "normalize: Latin Extended-A");
  suite.require(graders::normalize_text("a  b") == "a  b", "normalize: internal whitespace kept");
  suite.require(graders::normalize_text("　x ") == "x", "normalize: Unicode spaces trimmed");
  suite.require(graders::normalize_text("") == "", "normalize: empty input");
  suite.require(graders::normalize_text("   ") == "", "normalize: whitespace only");
}

void test_purity(TestSuite& suite) {
  auto item = cloze_item("pure");
  BlankAnswers answers{{"bin", "bist", "x", "sind"}};
  auto first = evaluate(item, answers, 10);
  auto second = evaluate(item, answers, 10);
  suite.require(first.correct == second.correct && near(first.score, second.score) &&
                    first.canonical_display == second.canonical_display,
                "evaluate is deterministic");
}

} // namespace

int main() {
  TestSuite suite;
  test_canonical_answers(suite);
  test_shape_mismatch(suite);
  test_multiple_choice(suite);
  test_multi_select(suite);
  test_cloze(suite);
  test_matching(suite);
  test_ordering(suite);
  test_true_false_and_flashcard(suite);
  test_slider(suite);
  test_text_input(suite);
  test_word_scramble(suite);
  test_error_detection(suite);
  test_normalization(suite);
  test_purity(suite);
  return recall::testing::finish(suite, "Evaluation");
}
