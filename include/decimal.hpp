#ifndef DECIMAL_HPP_
#define DECIMAL_HPP_

#include <cstdint>
#include <ostream>
#include <string>

namespace txledger {

/**
 * Exact fixed-point decimal: value = mantissa / 10^scale.
 *
 * Amounts are never converted to binary floating point. Addition and
 * subtraction align both operands to the larger scale; the result keeps that
 * scale so "5.12345" + "3" prints as "8.12345". Parsed values carry at most
 * 96 significant bits and 28 fraction digits. Results live in a 128-bit
 * mantissa, so a balance of 10^20 still adds exactly to an amount with 18
 * fraction digits. Arithmetic that does not fit throws std::overflow_error.
 */
class Decimal {
 public:
  __extension__ typedef __int128 Mantissa;

  static constexpr int kMaxScale = 28;
  static constexpr int kMaxParsedBits = 96;

  Decimal() = default;
  Decimal(Mantissa mantissa, int scale);

  /**
   * Parses "[+-]digits[.digits]". Throws std::invalid_argument on malformed
   * text or more than kMaxScale fraction digits, std::out_of_range when the
   * digits exceed kMaxParsedBits.
   */
  static Decimal parse(const std::string& text);

  static Decimal zero() { return Decimal(); }

  Mantissa mantissa() const { return mantissa_; }
  int scale() const { return scale_; }

  bool isNegative() const { return mantissa_ < 0; }
  bool isZero() const { return mantissa_ == 0; }

  // Same value expressed with `scale` fraction digits. Throws if scale is
  // smaller than the current one or the mantissa overflows.
  Decimal rescaled(int scale) const;

  std::string toString() const;

  Decimal operator+(const Decimal& other) const;
  Decimal operator-(const Decimal& other) const;
  Decimal operator-() const;
  Decimal& operator+=(const Decimal& other);
  Decimal& operator-=(const Decimal& other);

  // -1, 0 or 1 by numeric value, independent of scale.
  int compare(const Decimal& other) const;

  bool operator==(const Decimal& other) const { return compare(other) == 0; }
  bool operator!=(const Decimal& other) const { return compare(other) != 0; }
  bool operator<(const Decimal& other) const { return compare(other) < 0; }
  bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
  bool operator>(const Decimal& other) const { return compare(other) > 0; }
  bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

 private:
  Mantissa mantissa_ = 0;
  std::uint8_t scale_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

}  // namespace txledger

#endif  // DECIMAL_HPP_
