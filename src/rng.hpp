#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

namespace recall {

// xorshift64; a zero state is replaced by a fixed non-zero constant.
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

inline std::size_t rand_index(std::uint64_t& state, std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("rand_index: empty range");
  }
  return static_cast<std::size_t>(advance_rng(state) % static_cast<std::uint64_t>(size));
}

inline double rand_unit(std::uint64_t& state) {
  constexpr double denom = static_cast<double>(std::numeric_limits<std::uint64_t>::max());
  return static_cast<double>(advance_rng(state)) / denom;
}

inline std::uint64_t device_seed() {
  std::random_device device;
  const std::uint64_t high = static_cast<std::uint64_t>(device()) << 32;
  const std::uint64_t seed = high | static_cast<std::uint64_t>(device());
  return seed == 0 ? 1 : seed;
}

// RFC 4122 version 4 layout: xxxxxxxx-xxxx-4xxx-Nxxx-xxxxxxxxxxxx, N in [89ab].
inline std::string uuid_v4(std::uint64_t& state) {
  static const char* hex = "0123456789abcdef";
  std::uint64_t words[2] = {advance_rng(state), advance_rng(state)};
  words[0] = (words[0] & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  words[1] = (words[1] & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string out;
  out.reserve(36);
  for (int w = 0; w < 2; ++w) {
    for (int nibble = 15; nibble >= 0; --nibble) {
      out.push_back(hex[(words[w] >> (nibble * 4)) & 0xF]);
      const std::size_t len = out.size();
      if (len == 8 || len == 13 || len == 18 || len == 23) {
        out.push_back('-');
      }
    }
  }
  return out;
}

} // namespace recall
