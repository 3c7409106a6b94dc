#include "floodgate/random-stream.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string_view>

#include "floodgate/lehmer64.hpp"

namespace floodgate {

uint64_t NextStreamSeed() {
  thread_local uint64_t state = [] {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
  }();
  return SplitMix64(state);
}

RandomStream::RandomStream(uint64_t length, std::size_t chunkSize)
    : RandomStream(length, chunkSize, NextStreamSeed()) {}

RandomStream::RandomStream(uint64_t length, std::size_t chunkSize, uint64_t seed)
    : _rng(seed), _length(length), _remaining(length) {
  // No need to allocate more than the whole payload for small streams.
  _chunk.resize(static_cast<std::size_t>(std::min<uint64_t>(std::max<std::size_t>(chunkSize, 1U), length)));
}

std::string_view RandomStream::next() {
  if (_remaining == 0) {
    return {};
  }
  const auto len = static_cast<std::size_t>(std::min<uint64_t>(_chunk.size(), _remaining));
  _rng.fill(_chunk.data(), len);
  _remaining -= len;
  return {_chunk.data(), len};
}

}  // namespace floodgate
