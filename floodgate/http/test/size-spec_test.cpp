#include "floodgate/size-spec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string_view>
#include <variant>

namespace floodgate {

namespace {

constexpr uint64_t kMax = uint64_t{10} << 40;  // 10 TiB, large enough to not interfere

uint64_t Bytes(std::string_view token, uint64_t maxBytes = kMax) {
  const auto res = ParseSizeToken(token, maxBytes);
  const auto* spec = std::get_if<SizeSpec>(&res);
  return spec == nullptr ? 0 : spec->byteCount;
}

bool IsMalformed(std::string_view token) {
  return std::holds_alternative<MalformedSize>(ParseSizeToken(token, kMax));
}

}  // namespace

TEST(SizeSpec, DecimalUnits) {
  EXPECT_EQ(Bytes("10MB.bin"), 10000000U);
  EXPECT_EQ(Bytes("100B.bin"), 100U);
  EXPECT_EQ(Bytes("1KB.bin"), 1000U);
  EXPECT_EQ(Bytes("10M.bin"), 10000000U);
  EXPECT_EQ(Bytes("3GB.iso"), 3000000000U);
  EXPECT_EQ(Bytes("2TB.bin"), 2000000000000U);
}

TEST(SizeSpec, BinaryUnits) {
  EXPECT_EQ(Bytes("2GiB.bin"), 2147483648U);
  EXPECT_EQ(Bytes("97KiB.bin"), 99328U);
  EXPECT_EQ(Bytes("1Mi.bin"), 1048576U);
  EXPECT_EQ(Bytes("1TiB.bin"), uint64_t{1} << 40);
}

TEST(SizeSpec, CaseInsensitiveUnits) {
  EXPECT_EQ(Bytes("10mb.bin"), 10000000U);
  EXPECT_EQ(Bytes("1000mb.bin"), 1000000000U);
  EXPECT_EQ(Bytes("2gib.bin"), 2147483648U);
  EXPECT_EQ(Bytes("2GIB.BIN"), 2147483648U);
  EXPECT_EQ(Bytes("5b.txt"), 5U);
}

TEST(SizeSpec, FractionsAreFloored) {
  EXPECT_EQ(Bytes("1.5GB.iso"), 1500000000U);
  EXPECT_EQ(Bytes("0.5KiB.bin"), 512U);
  EXPECT_EQ(Bytes("1.0005KB.bin"), 1000U);
  EXPECT_EQ(Bytes("1.9999B.bin"), 1U);
  EXPECT_EQ(Bytes("0.001KiB.bin"), 1U);  // 1.024
  EXPECT_EQ(Bytes("0.0000000001TiB.bin"), 109U);  // 109.95...
}

TEST(SizeSpec, ParsedFields) {
  const auto res = ParseSizeToken("1.05GiB.tar.gz", kMax);
  ASSERT_TRUE(std::holds_alternative<SizeSpec>(res));
  const auto& spec = std::get<SizeSpec>(res);
  EXPECT_EQ(spec.whole, 1U);
  EXPECT_EQ(spec.fraction, 5U);
  EXPECT_EQ(spec.nbFractionDigits, 2U);
  EXPECT_EQ(spec.unit, SizeUnit::G);
  EXPECT_TRUE(spec.binaryMultiplier);
  EXPECT_EQ(spec.extension, "tar.gz");
  EXPECT_EQ(spec.str(), "1.05GiB");
  EXPECT_EQ(spec.byteCount, 1127428915U);  // floor(1.05 * 2^30)
}

TEST(SizeSpec, Malformed) {
  EXPECT_TRUE(IsMalformed("abc.bin"));
  EXPECT_TRUE(IsMalformed("MB.bin"));
  EXPECT_TRUE(IsMalformed("10.bin"));
  EXPECT_TRUE(IsMalformed("10"));
  EXPECT_TRUE(IsMalformed("10MB"));
  EXPECT_TRUE(IsMalformed("10MB."));
  EXPECT_TRUE(IsMalformed("10XB.bin"));
  EXPECT_TRUE(IsMalformed("10Bi.bin"));
  EXPECT_TRUE(IsMalformed("10MBB.bin"));
  EXPECT_TRUE(IsMalformed("1.MB.bin"));
  EXPECT_TRUE(IsMalformed("1.5.5MB.bin"));
  EXPECT_TRUE(IsMalformed("-1MB.bin"));
  EXPECT_TRUE(IsMalformed("10MB.a/b"));
  EXPECT_TRUE(IsMalformed(""));
}

TEST(SizeSpec, Zero) {
  EXPECT_EQ(ParseSizeToken("0MB.bin", kMax), SizeParseResult(SizeOutOfRange{0, false}));
  EXPECT_EQ(ParseSizeToken("0B.bin", kMax), SizeParseResult(SizeOutOfRange{0, false}));
  EXPECT_EQ(ParseSizeToken("0.0GiB.bin", kMax), SizeParseResult(SizeOutOfRange{0, false}));
  EXPECT_EQ(ParseSizeToken("0.1B.bin", kMax), SizeParseResult(SizeOutOfRange{0, false}));
}

TEST(SizeSpec, AboveMaximum) {
  static constexpr uint64_t kTenGiB = uint64_t{10} << 30;
  EXPECT_EQ(Bytes("10GiB.bin", kTenGiB), kTenGiB);
  EXPECT_EQ(ParseSizeToken("11GB.bin", kTenGiB), SizeParseResult(SizeOutOfRange{11000000000U, true}));
  EXPECT_EQ(ParseSizeToken("99999999999999999999999TB.bin", kTenGiB),
            SizeParseResult(SizeOutOfRange{std::numeric_limits<uint64_t>::max(), true}));
  EXPECT_EQ(ParseSizeToken("18446744073709551615TiB.bin", kTenGiB),
            SizeParseResult(SizeOutOfRange{std::numeric_limits<uint64_t>::max(), true}));
}

TEST(SizeSpec, Deterministic) {
  EXPECT_EQ(ParseSizeToken("42KiB.dat", kMax), ParseSizeToken("42KiB.dat", kMax));
}

}  // namespace floodgate
