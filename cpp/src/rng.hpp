#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace recall {

inline std::uint64_t seed_rng(std::uint64_t seed) {
  return seed == 0 ? 1 : seed;
}

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

// Fisher-Yates driven by the caller's xorshift state.
template <typename T>
void shuffle_with(std::vector<T>& values, std::uint64_t& state) {
  for (std::size_t i = values.size(); i > 1; --i) {
    const auto j = static_cast<std::size_t>(advance_rng(state) % i);
    std::swap(values[i - 1], values[j]);
  }
}

} // namespace recall
