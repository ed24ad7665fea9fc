#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ledger::schema {

/// Signed fixed-point decimal.
///
/// The value is `mantissa * 10^-scale`. Arithmetic and comparison are exact;
/// operands with different scales are aligned before the operation.
class decimal final {
 public:
  using mantissa_t = boost::multiprecision::cpp_int;

  decimal() = default;
  decimal(mantissa_t mantissa, uint32_t scale);

  /// Parse `[+-]digits[.digits]`. Returns std::nullopt on anything else.
  static std::optional<decimal> try_parse(std::string_view text);

  /// Render with exactly `fractional_digits` digits after the point,
  /// rounding half away from zero.
  std::string to_string(uint32_t fractional_digits) const;

  const mantissa_t& mantissa() const { return mantissa_; }
  uint32_t scale() const { return scale_; }
  bool is_zero() const { return mantissa_.is_zero(); }
  bool is_negative() const { return mantissa_.sign() < 0; }

  decimal& operator+=(const decimal& other);
  decimal& operator-=(const decimal& other);
  decimal operator-() const;

  friend decimal operator+(decimal lhs, const decimal& rhs) {
    lhs += rhs;
    return lhs;
  }
  friend decimal operator-(decimal lhs, const decimal& rhs) {
    lhs -= rhs;
    return lhs;
  }

  friend bool operator==(const decimal& lhs, const decimal& rhs) {
    return compare(lhs, rhs) == 0;
  }
  friend std::strong_ordering operator<=>(const decimal& lhs,
                                          const decimal& rhs) {
    return compare(lhs, rhs) <=> 0;
  }

 private:
  static int compare(const decimal& lhs, const decimal& rhs);
  /// Mantissa of `this` expressed at `scale` (which must be >= scale_).
  mantissa_t rescaled(uint32_t scale) const;

  mantissa_t mantissa_{};
  uint32_t scale_{};
};

using decimal_t = decimal;

/// Parse a decimal literal known to be valid. Aborts through
/// `ledger::common::critical` otherwise.
decimal_t make_decimal(std::string_view text);

}  // namespace ledger::schema
