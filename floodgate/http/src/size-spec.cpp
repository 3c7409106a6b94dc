#include "floodgate/size-spec.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "floodgate/string-equal-ignore-case.hpp"

namespace floodgate {

namespace {

using uint128 = unsigned __int128;

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

constexpr uint128 Pow(uint128 base, uint32_t exp) noexcept {
  uint128 ret = 1;
  while (exp-- != 0) {
    ret *= base;
  }
  return ret;
}

constexpr std::string_view kUnitLetters = "BKMGT";

}  // namespace

std::string SizeSpec::str() const {
  std::string ret = std::to_string(whole);
  if (nbFractionDigits != 0) {
    const std::string digits = std::to_string(fraction);
    ret.push_back('.');
    ret.append(nbFractionDigits - digits.size(), '0');
    ret.append(digits);
  }
  ret.push_back(kUnitLetters[static_cast<std::size_t>(unit)]);
  if (unit != SizeUnit::B) {
    if (binaryMultiplier) {
      ret.push_back('i');
    }
    ret.push_back('B');
  }
  return ret;
}

SizeParseResult ParseSizeToken(std::string_view token, uint64_t maxBytes) {
  SizeSpec spec;
  std::size_t pos = 0;

  // Integral part. Values that do not fit 64 bits are necessarily above any maximum.
  bool wholeOverflow = false;
  for (; pos < token.size() && IsDigit(token[pos]); ++pos) {
    const auto digit = static_cast<uint64_t>(token[pos] - '0');
    if (spec.whole > (std::numeric_limits<uint64_t>::max() - digit) / 10U) {
      wholeOverflow = true;
    } else {
      spec.whole = (spec.whole * 10U) + digit;
    }
  }
  if (pos == 0) {
    return MalformedSize{"size must start with digits"};
  }

  // Optional fractional part.
  if (pos < token.size() && token[pos] == '.' && pos + 1 < token.size() && IsDigit(token[pos + 1])) {
    for (++pos; pos < token.size() && IsDigit(token[pos]); ++pos) {
      if (spec.nbFractionDigits < SizeSpec::kMaxFractionDigits) {
        spec.fraction = (spec.fraction * 10U) + static_cast<uint64_t>(token[pos] - '0');
        ++spec.nbFractionDigits;
      }
    }
  }

  // Unit: B, or one of KMGT followed by an optional 'i' and an optional 'B'.
  if (pos == token.size()) {
    return MalformedSize{"missing unit"};
  }
  const auto unitIdx = kUnitLetters.find(toupper(token[pos]));
  if (unitIdx == std::string_view::npos) {
    return MalformedSize{"missing unit"};
  }
  spec.unit = static_cast<SizeUnit>(unitIdx);
  ++pos;
  if (spec.unit != SizeUnit::B) {
    if (pos < token.size() && tolower(token[pos]) == 'i') {
      spec.binaryMultiplier = true;
      ++pos;
    }
    if (pos < token.size() && toupper(token[pos]) == 'B') {
      ++pos;
    }
  }

  // Extension: a dot, then at least one character, none of them being a path separator.
  if (pos == token.size() || token[pos] != '.') {
    return MalformedSize{"missing extension"};
  }
  const std::string_view extension = token.substr(pos + 1);
  if (extension.empty()) {
    return MalformedSize{"missing extension"};
  }
  if (extension.find('/') != std::string_view::npos) {
    return MalformedSize{"extension must not contain '/'"};
  }

  static constexpr uint64_t kSaturated = std::numeric_limits<uint64_t>::max();
  if (wholeOverflow) {
    return SizeOutOfRange{kSaturated, true};
  }

  // whole < 2^64 and multiplier <= 2^40: the products below cannot overflow 128 bits.
  const uint128 multiplier = Pow(spec.multiplierBase(), spec.unitPower());
  uint128 total = static_cast<uint128>(spec.whole) * multiplier;
  if (spec.nbFractionDigits != 0) {
    total += (static_cast<uint128>(spec.fraction) * multiplier) / Pow(10U, spec.nbFractionDigits);
  }

  if (total == 0) {
    return SizeOutOfRange{0, false};
  }
  if (total > maxBytes) {
    return SizeOutOfRange{total > kSaturated ? kSaturated : static_cast<uint64_t>(total), true};
  }

  spec.byteCount = static_cast<uint64_t>(total);
  spec.extension = extension;
  return spec;
}

}  // namespace floodgate
