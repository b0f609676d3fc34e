#include "numeric.hpp"

#include <algorithm>
#include <cmath>

namespace recall::graders {
namespace {

// Absorbs representation error for decimal tolerances (0.1 + 0.2 vs 0.3).
constexpr double kToleranceSlack = 1e-9;

} // namespace

Grade grade(const SliderPayload& payload, const NumericAnswer& submission) {
  if (!std::isfinite(submission.value)) {
    return all_or_nothing(false);
  }
  const double tolerance = std::max(payload.tolerance, 0.0);
  const double distance = std::fabs(submission.value - payload.target);
  return all_or_nothing(distance <= tolerance + kToleranceSlack);
}

NumericAnswer canonical_submission(const SliderPayload& payload) {
  return NumericAnswer{payload.target};
}

std::string describe_answer(const SliderPayload& payload) {
  std::string out = format_number(payload.target);
  if (!payload.unit.empty()) {
    out += " " + payload.unit;
  }
  return out;
}

} // namespace recall::graders
