#pragma once

#include "../include/recall/errors.hpp"
#include "../include/recall/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace recall::graders {

struct Grade {
  double score = 0.0;
  bool correct = false;
};

inline Grade all_or_nothing(bool ok) {
  return Grade{ok ? 1.0 : 0.0, ok};
}

// Partial credit; `correct` only on a perfect score.
inline Grade proportional(std::size_t hits, std::size_t total) {
  if (total == 0) {
    return Grade{1.0, true};
  }
  const double score = static_cast<double>(hits) / static_cast<double>(total);
  return Grade{detail::clip01(score), hits == total};
}

// Maps each payload type to the only submission shape it accepts. No primary definition.
template <typename PayloadT>
struct SubmissionFor;

// Strips leading/trailing Unicode whitespace. Internal whitespace is kept.
std::string trim_text(std::string_view text);

// Simple + full (ß -> ss) case folding for Latin, Greek and Cyrillic letters.
std::string fold_case(std::string_view text);

// trim_text followed by fold_case.
std::string normalize_text(std::string_view text);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

std::string format_number(double value);

} // namespace recall::graders
