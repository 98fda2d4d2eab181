#include <bondcurve/numeric/fixed_point.hpp>

#include <limits>

namespace bondcurve::numeric {

namespace {

// Index of the highest set bit, or -1 for zero
int bit_width( const uint512& value )
{
  if( value == 0 )
    return -1;

  return static_cast< int >( boost::multiprecision::msb( value ) );
}

bool shift_fits( const uint512& value, unsigned shift )
{
  return bit_width( value ) + static_cast< int >( shift ) < static_cast< int >( fixed_point::storage_bits );
}

} // namespace

fixed_point::fixed_point( const uint512& raw ):
    _raw( raw )
{}

fixed_point fixed_point::zero()
{
  return fixed_point( uint512( 0 ) );
}

fixed_point fixed_point::one()
{
  return fixed_point( uint512( 1 ) << fractional_bits );
}

fixed_point fixed_point::from_raw( const uint512& raw )
{
  return fixed_point( raw );
}

result< fixed_point > fixed_point::from_integer( const uint512& value )
{
  if( !shift_fits( value, fractional_bits ) )
    return std::unexpected( numeric_errc::overflow );

  return fixed_point( value << fractional_bits );
}

result< fixed_point > fixed_point::from_ratio( const uint512& numerator, const uint512& denominator )
{
  if( denominator == 0 )
    return std::unexpected( numeric_errc::precision_failure );

  if( !shift_fits( numerator, fractional_bits ) )
    return std::unexpected( numeric_errc::overflow );

  return fixed_point( ( numerator << fractional_bits ) / denominator );
}

const uint512& fixed_point::raw() const noexcept
{
  return _raw;
}

result< fixed_point > fixed_point::add( const fixed_point& other ) const
{
  if( std::numeric_limits< uint512 >::max() - _raw < other._raw )
    return std::unexpected( numeric_errc::overflow );

  return fixed_point( _raw + other._raw );
}

result< fixed_point > fixed_point::sub( const fixed_point& other ) const
{
  if( _raw < other._raw )
    return std::unexpected( numeric_errc::underflow );

  return fixed_point( _raw - other._raw );
}

result< fixed_point > fixed_point::mul( const fixed_point& other ) const
{
  if( _raw == 0 || other._raw == 0 )
    return zero();

  // The product of an m-bit and an n-bit number needs at most m + n bits
  if( bit_width( _raw ) + bit_width( other._raw ) + 1 >= static_cast< int >( storage_bits ) )
    return std::unexpected( numeric_errc::overflow );

  return fixed_point( ( _raw * other._raw ) >> fractional_bits );
}

result< fixed_point > fixed_point::sqrt() const
{
  // sqrt( raw / 2^F ) * 2^F == sqrt( raw * 2^F )
  if( !shift_fits( _raw, fractional_bits ) )
    return std::unexpected( numeric_errc::precision_failure );

  return fixed_point( boost::multiprecision::sqrt( uint512( _raw << fractional_bits ) ) );
}

result< uint128 > fixed_point::truncate() const
{
  uint512 integral = _raw >> fractional_bits;

  if( integral > uint512( std::numeric_limits< uint128 >::max() ) )
    return std::unexpected( numeric_errc::overflow );

  return static_cast< uint128 >( integral );
}

bool operator==( const fixed_point& lhs, const fixed_point& rhs ) noexcept
{
  return lhs._raw == rhs._raw;
}

} // namespace bondcurve::numeric
