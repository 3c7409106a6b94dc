#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace floodgate {

// SplitMix64 step, used to expand a single 64 bits seed into independent generator states.
constexpr uint64_t SplitMix64(uint64_t& state) noexcept {
  uint64_t ret = (state += 0x9e3779b97f4a7c15ULL);
  ret = (ret ^ (ret >> 30)) * 0xbf58476d1ce4e5b9ULL;
  ret = (ret ^ (ret >> 27)) * 0x94d049bb133111ebULL;
  return ret ^ (ret >> 31);
}

// Three interleaved 128 bits Lehmer (multiplicative congruential) generators.
// Each call returns the high 64 bits of one of the states, and the three states are advanced together every third
// call, which lets the three multiplications be pipelined.
// Not cryptographically secure: it only has to be fast and to produce incompressible bytes.
class Lehmer64x3 {
 public:
  static constexpr uint64_t kMultiplier = 0xda942042e4dd58b5ULL;

  explicit constexpr Lehmer64x3(uint64_t seed) noexcept {
    for (auto& state : _state) {
      // A multiplicative generator with an even (in particular zero) state degenerates.
      state = static_cast<unsigned __int128>(SplitMix64(seed)) | 1U;
    }
  }

  constexpr uint64_t operator()() noexcept {
    if (++_pos == 3) {
      _state[0] *= kMultiplier;
      _state[1] *= kMultiplier;
      _state[2] *= kMultiplier;
      _pos = 0;
    }
    return static_cast<uint64_t>(_state[_pos] >> 64);
  }

  // Fill [out, out + len) with random bytes.
  void fill(char* out, std::size_t len) noexcept {
    for (; len >= sizeof(uint64_t); len -= sizeof(uint64_t), out += sizeof(uint64_t)) {
      const uint64_t value = (*this)();
      std::memcpy(out, &value, sizeof(uint64_t));
    }
    if (len != 0) {
      const uint64_t value = (*this)();
      std::memcpy(out, &value, len);
    }
  }

 private:
  unsigned __int128 _state[3]{};
  uint32_t _pos{2};
};

}  // namespace floodgate
