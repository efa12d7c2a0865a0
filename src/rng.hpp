#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sz {

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

inline std::uint64_t seed_from_clock() {
  auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  auto wall = std::chrono::system_clock::now().time_since_epoch().count();
  return static_cast<std::uint64_t>(ticks) * 0x9E3779B97F4A7C15ULL ^
         static_cast<std::uint64_t>(wall);
}

// `digits` lowercase hex characters drawn from the generator.
inline std::string rand_hex(std::uint64_t& state, int digits) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(digits));
  std::uint64_t bits = advance_rng(state);
  for (int i = 0; i < digits; ++i) {
    if (i > 0 && i % 16 == 0) {
      bits = advance_rng(state);
    }
    out.push_back(hex[bits & 0x0F]);
    bits >>= 4;
  }
  return out;
}

} // namespace sz
