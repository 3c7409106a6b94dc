#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace floodgate {

enum class SizeUnit : uint8_t { B, K, M, G, T };

// Parsed form of a size token such as "10MB.bin", "2GiB.bin" or "1.5GB.iso".
struct SizeSpec {
  static constexpr uint8_t kMaxFractionDigits = 18;

  // Exponent applied to the multiplier: 0 for B, 1 for K, ..., 4 for T.
  [[nodiscard]] constexpr uint32_t unitPower() const noexcept { return static_cast<uint32_t>(unit); }

  [[nodiscard]] constexpr uint64_t multiplierBase() const noexcept { return binaryMultiplier ? 1024U : 1000U; }

  // Canonical text of the size part, e.g. "1.5GiB", without the extension.
  [[nodiscard]] std::string str() const;

  bool operator==(const SizeSpec&) const noexcept = default;

  // Integral part of the magnitude.
  uint64_t whole{};
  // Fractional digits of the magnitude as an integer, nbFractionDigits long ("1.05" -> fraction 5, 2 digits).
  uint64_t fraction{};
  uint8_t nbFractionDigits{};
  SizeUnit unit{SizeUnit::B};
  bool binaryMultiplier{false};
  // Everything after the dot following the unit, never empty.
  std::string extension;
  // Resolved total, floor(magnitude * base^unitPower). Always > 0 and <= the maximum given to the parser.
  uint64_t byteCount{};
};

// The token does not follow <digits>[.<digits>]<unit>[i][B].<extension>.
struct MalformedSize {
  bool operator==(const MalformedSize&) const noexcept = default;

  std::string_view reason;
};

// The token is well formed, but resolves to 0 bytes or to more than the allowed maximum.
struct SizeOutOfRange {
  bool operator==(const SizeOutOfRange&) const noexcept = default;

  // Saturated to UINT64_MAX when the real value does not fit.
  uint64_t byteCount{};
  bool exceedsMaximum{false};
};

using SizeParseResult = std::variant<SizeSpec, MalformedSize, SizeOutOfRange>;

// Parses a size token (path segment without its leading '/'). Unit letters are case-insensitive, a trailing 'i' after
// the unit letter selects the 1024 based multiplier. Fractional magnitudes are floored to the byte, never rounded up.
// Fraction digits beyond kMaxFractionDigits are ignored.
// Pure function: the result only depends on token and maxBytes.
[[nodiscard]] SizeParseResult ParseSizeToken(std::string_view token, uint64_t maxBytes);

}  // namespace floodgate
