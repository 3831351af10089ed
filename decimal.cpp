#include "decimal.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace txledger {

namespace {

using Mantissa = Decimal::Mantissa;
__extension__ typedef unsigned __int128 Magnitude;

constexpr Mantissa kMaxMantissa = static_cast<Mantissa>(~Magnitude{0} >> 1);
constexpr Mantissa kMinMantissa = -kMaxMantissa - 1;
constexpr Mantissa kMaxParsed = (Mantissa{1} << Decimal::kMaxParsedBits) - 1;

constexpr std::array<Mantissa, Decimal::kMaxScale + 1> makePow10() {
  std::array<Mantissa, Decimal::kMaxScale + 1> table{};
  Mantissa value = 1;
  for (std::size_t i = 0; i < table.size(); ++i) {
    table[i] = value;
    value *= 10;
  }
  return table;
}

constexpr std::array<Mantissa, Decimal::kMaxScale + 1> kPow10 = makePow10();

// `factor` is always a positive power of ten.
bool mulOverflows(Mantissa value, Mantissa factor) {
  if (value > 0) return value > kMaxMantissa / factor;
  if (value < 0) return value < kMinMantissa / factor;
  return false;
}

bool addOverflows(Mantissa a, Mantissa b) {
  return (b > 0 && a > kMaxMantissa - b) || (b < 0 && a < kMinMantissa - b);
}

bool subOverflows(Mantissa a, Mantissa b) {
  return (b < 0 && a > kMaxMantissa + b) || (b > 0 && a < kMinMantissa + b);
}

}  // namespace

Decimal::Decimal(Mantissa mantissa, int scale) : mantissa_(mantissa) {
  if (scale < 0 || scale > kMaxScale) {
    throw std::invalid_argument("decimal scale out of range: " + std::to_string(scale));
  }
  scale_ = static_cast<std::uint8_t>(scale);
}

Decimal Decimal::parse(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty decimal");
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[0] == '+' || text[0] == '-') {
    negative = text[0] == '-';
    ++pos;
  }

  Mantissa mantissa = 0;
  int scale = 0;
  bool seen_digit = false;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        throw std::invalid_argument("malformed decimal: " + text);
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      throw std::invalid_argument("malformed decimal: " + text);
    }
    if (seen_point && ++scale > kMaxScale) {
      throw std::invalid_argument("too many fraction digits: " + text);
    }
    const int digit = c - '0';
    if (mantissa > (kMaxParsed - digit) / 10) {
      throw std::out_of_range("decimal out of range: " + text);
    }
    mantissa = mantissa * 10 + digit;
    seen_digit = true;
  }

  if (!seen_digit) {
    throw std::invalid_argument("malformed decimal: " + text);
  }
  return Decimal(negative ? -mantissa : mantissa, scale);
}

Decimal Decimal::rescaled(int scale) const {
  if (scale < scale_ || scale > kMaxScale) {
    throw std::invalid_argument("cannot rescale decimal to " + std::to_string(scale));
  }
  const Mantissa factor = kPow10[scale - scale_];
  if (mulOverflows(mantissa_, factor)) {
    throw std::overflow_error("decimal overflow rescaling " + toString());
  }
  return Decimal(mantissa_ * factor, scale);
}

std::string Decimal::toString() const {
  Magnitude magnitude = mantissa_ < 0
      ? Magnitude{0} - static_cast<Magnitude>(mantissa_)
      : static_cast<Magnitude>(mantissa_);
  std::string digits;
  do {
    digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
    magnitude /= 10;
  } while (magnitude != 0);
  std::reverse(digits.begin(), digits.end());

  if (scale_ > 0) {
    if (digits.size() <= scale_) {
      digits.insert(0, scale_ + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - scale_, 1, '.');
  }
  if (mantissa_ < 0) {
    digits.insert(0, 1, '-');
  }
  return digits;
}

Decimal Decimal::operator+(const Decimal& other) const {
  const int scale = std::max(scale_, other.scale_);
  const Mantissa lhs = rescaled(scale).mantissa_;
  const Mantissa rhs = other.rescaled(scale).mantissa_;
  if (addOverflows(lhs, rhs)) {
    throw std::overflow_error("decimal overflow: " + toString() + " + " + other.toString());
  }
  return Decimal(lhs + rhs, scale);
}

Decimal Decimal::operator-(const Decimal& other) const {
  const int scale = std::max(scale_, other.scale_);
  const Mantissa lhs = rescaled(scale).mantissa_;
  const Mantissa rhs = other.rescaled(scale).mantissa_;
  if (subOverflows(lhs, rhs)) {
    throw std::overflow_error("decimal overflow: " + toString() + " - " + other.toString());
  }
  return Decimal(lhs - rhs, scale);
}

Decimal Decimal::operator-() const {
  if (mantissa_ == kMinMantissa) {
    throw std::overflow_error("decimal overflow negating " + toString());
  }
  return Decimal(-mantissa_, scale_);
}

Decimal& Decimal::operator+=(const Decimal& other) {
  *this = *this + other;
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
  *this = *this - other;
  return *this;
}

int Decimal::compare(const Decimal& other) const {
  // Integer parts first, then fraction parts aligned to the common scale.
  // Splitting keeps every intermediate below 10^28.
  const Mantissa lhs_int = mantissa_ / kPow10[scale_];
  const Mantissa rhs_int = other.mantissa_ / kPow10[other.scale_];
  if (lhs_int != rhs_int) {
    return lhs_int < rhs_int ? -1 : 1;
  }

  const int scale = std::max(scale_, other.scale_);
  const Mantissa lhs_frac = (mantissa_ % kPow10[scale_]) * kPow10[scale - scale_];
  const Mantissa rhs_frac =
      (other.mantissa_ % kPow10[other.scale_]) * kPow10[scale - other.scale_];
  if (lhs_frac != rhs_frac) {
    return lhs_frac < rhs_frac ? -1 : 1;
  }
  return 0;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
  return os << value.toString();
}

}  // namespace txledger
