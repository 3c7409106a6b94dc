#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "floodgate/lehmer64.hpp"

namespace floodgate {

// Finite, pull based stream of exactly 'length' pseudo random bytes, produced chunk by chunk.
// Only one chunk is held in memory at a time, whatever the length. Not restartable.
// Each stream owns its generator: streams are independent and never shared between threads.
class RandomStream {
 public:
  // Seeded from a per thread seed sequence, itself seeded from std::random_device.
  RandomStream(uint64_t length, std::size_t chunkSize);

  RandomStream(uint64_t length, std::size_t chunkSize, uint64_t seed);

  // Next chunk of at most chunkSize bytes, in generation order.
  // The returned view is valid until the next call. Empty once the stream is exhausted.
  std::string_view next();

  [[nodiscard]] uint64_t remaining() const noexcept { return _remaining; }

  [[nodiscard]] uint64_t generated() const noexcept { return _length - _remaining; }

  [[nodiscard]] bool exhausted() const noexcept { return _remaining == 0; }

 private:
  Lehmer64x3 _rng;
  std::string _chunk;
  uint64_t _length;
  uint64_t _remaining;
};

// Next seed of the calling thread's seed sequence.
uint64_t NextStreamSeed();

}  // namespace floodgate
