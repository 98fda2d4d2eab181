#pragma once

#include <bondcurve/numeric/error.hpp>
#include <bondcurve/numeric/uint128.hpp>

namespace bondcurve::numeric {

/**
 * Unsigned Q128 fixed point number held in a 512-bit integer.
 *
 * The value represented is raw / 2^128. Every operation that could leave the
 * 512-bit domain reports an error instead of wrapping, and every division or
 * root truncates toward zero.
 */
class fixed_point final
{
public:
  static constexpr unsigned fractional_bits = 128;
  static constexpr unsigned storage_bits    = 512;

  fixed_point() = default;

  static fixed_point zero();
  static fixed_point one();
  static fixed_point from_raw( const uint512& raw );
  static result< fixed_point > from_integer( const uint512& value );

  /**
   * Returns numerator / denominator. A zero denominator is a precision
   * failure rather than a division fault.
   */
  static result< fixed_point > from_ratio( const uint512& numerator, const uint512& denominator );

  const uint512& raw() const noexcept;

  result< fixed_point > add( const fixed_point& other ) const;
  result< fixed_point > sub( const fixed_point& other ) const;
  result< fixed_point > mul( const fixed_point& other ) const;
  result< fixed_point > sqrt() const;

  /**
   * Drops the fractional part. Fails when the integral part does not fit in
   * 128 bits.
   */
  result< uint128 > truncate() const;

  friend bool operator==( const fixed_point& lhs, const fixed_point& rhs ) noexcept;

private:
  explicit fixed_point( const uint512& raw );

  uint512 _raw = 0;
};

} // namespace bondcurve::numeric
