#include <bondcurve/encode/hex.hpp>

#include <cstdint>
#include <string_view>

namespace bondcurve::encode {

using namespace std::string_view_literals;

constexpr auto hex_digits   = "0123456789abcdef"sv;
constexpr auto hex_prefix   = "0x"sv;
constexpr char hex_offset   = 10;
constexpr unsigned nibble   = 4;
constexpr std::uint8_t mask = 0x0f;

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string hex;
  hex.reserve( hex_prefix.size() + s.size() * 2 );
  hex.append( hex_prefix );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    hex.push_back( hex_digits[ value >> nibble ] );
    hex.push_back( hex_digits[ value & mask ] );
  }

  return hex;
}

static result< std::uint8_t > hex_to_nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_digit );
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( hex_prefix ) )
    sv.remove_prefix( hex_prefix.size() );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::odd_digit_count );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = hex_to_nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = hex_to_nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble | *low ) );
  }

  return bytes;
}

} // namespace bondcurve::encode
