#include <ledger/common/critical.hpp>
#include <ledger/schema/decimal.hpp>

#include <algorithm>
#include <utility>

namespace ledger::schema {

namespace {

decimal::mantissa_t pow10(const uint32_t exponent) {
  return boost::multiprecision::pow(decimal::mantissa_t{10}, exponent);
}

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

decimal::decimal(mantissa_t mantissa, const uint32_t scale)
    : mantissa_{std::move(mantissa)}, scale_{scale} {}

std::optional<decimal> decimal::try_parse(std::string_view text) {
  auto negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  auto mantissa = mantissa_t{};
  auto scale = uint32_t{0};
  auto digits = std::size_t{0};
  auto seen_point = false;
  for (const auto c : text) {
    if (c == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (!is_digit(c)) {
      return std::nullopt;
    }
    mantissa *= 10;
    mantissa += static_cast<unsigned>(c - '0');
    ++digits;
    if (seen_point) {
      ++scale;
    }
  }
  if (digits == 0) {
    return std::nullopt;
  }
  if (negative) {
    mantissa = -mantissa;
  }
  return decimal{std::move(mantissa), scale};
}

std::string decimal::to_string(const uint32_t fractional_digits) const {
  auto units = mantissa_t{};
  if (scale_ <= fractional_digits) {
    units = mantissa_ * pow10(fractional_digits - scale_);
  } else {
    const mantissa_t divisor = pow10(scale_ - fractional_digits);
    units = mantissa_ / divisor;
    const mantissa_t remainder =
        boost::multiprecision::abs(mantissa_ % divisor);
    if (remainder * 2 >= divisor) {
      units += mantissa_.sign() < 0 ? -1 : 1;
    }
  }

  const mantissa_t magnitude = boost::multiprecision::abs(units);
  auto digits = magnitude.str();
  if (digits.size() <= fractional_digits) {
    digits.insert(0, fractional_digits + 1 - digits.size(), '0');
  }

  auto out = std::string{};
  out.reserve(digits.size() + 2);
  if (units.sign() < 0) {
    out.push_back('-');
  }
  const auto integral = digits.size() - fractional_digits;
  out.append(digits, 0, integral);
  if (fractional_digits > 0) {
    out.push_back('.');
    out.append(digits, integral, std::string::npos);
  }
  return out;
}

decimal& decimal::operator+=(const decimal& other) {
  const auto scale = std::max(scale_, other.scale_);
  mantissa_ = rescaled(scale) + other.rescaled(scale);
  scale_ = scale;
  return *this;
}

decimal& decimal::operator-=(const decimal& other) {
  const auto scale = std::max(scale_, other.scale_);
  mantissa_ = rescaled(scale) - other.rescaled(scale);
  scale_ = scale;
  return *this;
}

decimal decimal::operator-() const {
  return decimal{-mantissa_, scale_};
}

int decimal::compare(const decimal& lhs, const decimal& rhs) {
  const auto scale = std::max(lhs.scale_, rhs.scale_);
  return lhs.rescaled(scale).compare(rhs.rescaled(scale));
}

decimal::mantissa_t decimal::rescaled(const uint32_t scale) const {
  if (scale == scale_) {
    return mantissa_;
  }
  return mantissa_ * pow10(scale - scale_);
}

decimal_t make_decimal(const std::string_view text) {
  auto parsed = decimal::try_parse(text);
  if (!parsed) {
    ledger::common::critical("invalid decimal literal '{}'", text);
  }
  return std::move(parsed.value());
}

}  // namespace ledger::schema
