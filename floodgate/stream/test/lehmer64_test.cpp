#include "floodgate/lehmer64.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <string>

namespace floodgate {

TEST(Lehmer64x3, SameSeedSameSequence) {
  Lehmer64x3 lhs(42);
  Lehmer64x3 rhs(42);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(lhs(), rhs());
  }
}

TEST(Lehmer64x3, DifferentSeedsDiverge) {
  Lehmer64x3 lhs(1);
  Lehmer64x3 rhs(2);
  int nbEqual = 0;
  for (int i = 0; i < 100; ++i) {
    nbEqual += static_cast<int>(lhs() == rhs());
  }
  EXPECT_EQ(nbEqual, 0);
}

TEST(Lehmer64x3, ZeroSeedDoesNotDegenerate) {
  Lehmer64x3 rng(0);
  std::set<uint64_t> values;
  for (int i = 0; i < 64; ++i) {
    values.insert(rng());
  }
  EXPECT_EQ(values.size(), 64U);
}

TEST(Lehmer64x3, FillPartialTail) {
  std::string full(16, '\0');
  std::string partial(13, '\0');
  Lehmer64x3(7).fill(full.data(), full.size());
  Lehmer64x3(7).fill(partial.data(), partial.size());
  EXPECT_EQ(full.substr(0, partial.size()), partial);
  EXPECT_NE(full, std::string(16, '\0'));
}

}  // namespace floodgate
