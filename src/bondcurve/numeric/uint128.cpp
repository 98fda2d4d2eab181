#include <bondcurve/numeric/uint128.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>

namespace bondcurve::numeric {

constexpr unsigned bits_per_byte = 8;
constexpr unsigned decimal_base  = 10;

result< uint128 > checked_add( const uint128& lhs, const uint128& rhs )
{
  if( std::numeric_limits< uint128 >::max() - lhs < rhs )
    return std::unexpected( numeric_errc::overflow );

  return lhs + rhs;
}

result< uint128 > checked_sub( const uint128& lhs, const uint128& rhs )
{
  if( lhs < rhs )
    return std::unexpected( numeric_errc::underflow );

  return lhs - rhs;
}

result< uint128 > checked_mul( const uint128& lhs, const uint128& rhs )
{
  if( lhs != 0 && rhs > std::numeric_limits< uint128 >::max() / lhs )
    return std::unexpected( numeric_errc::overflow );

  return lhs * rhs;
}

uint128_bytes to_little_endian( const uint128& value )
{
  std::array< std::uint8_t, uint128_size > raw{};
  boost::multiprecision::export_bits( value, raw.begin(), bits_per_byte, false );

  uint128_bytes bytes{};
  std::ranges::transform( raw,
                          bytes.begin(),
                          []( std::uint8_t b )
                          {
                            return static_cast< std::byte >( b );
                          } );
  return bytes;
}

result< uint128 > from_little_endian( std::span< const std::byte > bytes )
{
  if( bytes.size() != uint128_size )
    return std::unexpected( numeric_errc::invalid_length );

  std::array< std::uint8_t, uint128_size > raw{};
  std::ranges::transform( bytes,
                          raw.begin(),
                          []( std::byte b )
                          {
                            return std::to_integer< std::uint8_t >( b );
                          } );

  uint128 value = 0;
  boost::multiprecision::import_bits( value, raw.begin(), raw.end(), bits_per_byte, false );
  return value;
}

result< uint128 > from_string( std::string_view sv )
{
  if( sv.empty() )
    return std::unexpected( numeric_errc::invalid_format );

  uint128 value = 0;

  for( char c: sv )
  {
    if( c < '0' || c > '9' )
      return std::unexpected( numeric_errc::invalid_format );

    auto next = checked_mul( value, decimal_base ).and_then(
      [ c ]( const uint128& shifted )
      {
        return checked_add( shifted, static_cast< unsigned int >( c - '0' ) );
      } );

    if( !next )
      return std::unexpected( numeric_errc::overflow );

    value = *next;
  }

  return value;
}

} // namespace bondcurve::numeric
