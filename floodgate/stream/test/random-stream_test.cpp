#include "floodgate/random-stream.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace floodgate {

namespace {

uint64_t DrainAll(RandomStream& stream, std::size_t chunkSize) {
  uint64_t total = 0;
  for (auto chunk = stream.next(); !chunk.empty(); chunk = stream.next()) {
    EXPECT_LE(chunk.size(), chunkSize);
    total += chunk.size();
    EXPECT_EQ(stream.generated(), total);
  }
  return total;
}

}  // namespace

TEST(RandomStream, ExactLengthWhateverTheChunkSize) {
  for (uint64_t length : {uint64_t{1}, uint64_t{7}, uint64_t{4096}, uint64_t{16384}, uint64_t{100000},
                          uint64_t{1000003}}) {
    for (std::size_t chunkSize : {std::size_t{1} << 10, std::size_t{3}, std::size_t{16} << 10, std::size_t{65536}}) {
      if (length > 100000 && chunkSize < 1024) {
        continue;
      }
      RandomStream stream(length, chunkSize, 1234);
      EXPECT_EQ(DrainAll(stream, chunkSize), length) << length << " / " << chunkSize;
      EXPECT_TRUE(stream.exhausted());
      EXPECT_EQ(stream.remaining(), 0U);
    }
  }
}

TEST(RandomStream, ExhaustedStreamStaysEmpty) {
  RandomStream stream(10, 4, 1);
  EXPECT_EQ(stream.next().size(), 4U);
  EXPECT_EQ(stream.next().size(), 4U);
  EXPECT_EQ(stream.next().size(), 2U);
  EXPECT_TRUE(stream.next().empty());
  EXPECT_TRUE(stream.next().empty());
  EXPECT_EQ(stream.generated(), 10U);
}

TEST(RandomStream, ZeroLength) {
  RandomStream stream(0, 16384);
  EXPECT_TRUE(stream.exhausted());
  EXPECT_TRUE(stream.next().empty());
}

TEST(RandomStream, SeededStreamsAreReproducible) {
  RandomStream lhs(50000, 4096, 99);
  RandomStream rhs(50000, 1000, 99);
  std::string lhsData;
  std::string rhsData;
  for (auto chunk = lhs.next(); !chunk.empty(); chunk = lhs.next()) {
    lhsData.append(chunk);
  }
  for (auto chunk = rhs.next(); !chunk.empty(); chunk = rhs.next()) {
    rhsData.append(chunk);
  }
  // Both chunk sizes are multiples of the generator word size.
  EXPECT_EQ(lhsData, rhsData);
}

TEST(RandomStream, IndependentStreams) {
  RandomStream lhs(4096, 4096);
  RandomStream rhs(4096, 4096);
  const std::string first(lhs.next());
  EXPECT_NE(first, rhs.next());
  EXPECT_EQ(lhs.remaining(), 0U);
  EXPECT_EQ(rhs.remaining(), 0U);
}

TEST(RandomStream, BytesLookRandom) {
  RandomStream stream(1 << 20, 1 << 16, 5);
  uint64_t histogram[256]{};
  for (auto chunk = stream.next(); !chunk.empty(); chunk = stream.next()) {
    for (char ch : chunk) {
      ++histogram[static_cast<unsigned char>(ch)];
    }
  }
  // 4096 expected per value
  for (auto count : histogram) {
    EXPECT_GT(count, 3500U);
    EXPECT_LT(count, 4700U);
  }
}

}  // namespace floodgate
