#include <bondcurve/protocol/event.hpp>

#include <algorithm>

#include <bondcurve/memory.hpp>

namespace bondcurve::protocol {

namespace {

constexpr std::size_t payload_size = 2 * numeric::uint128_size + account_length;

void append( std::vector< std::byte >& data, const numeric::uint128& value )
{
  const auto bytes = numeric::to_little_endian( value );
  data.insert( data.end(), bytes.begin(), bytes.end() );
}

void append( std::vector< std::byte >& data, const account& a )
{
  const auto bytes = memory::as_bytes( a );
  data.insert( data.end(), bytes.begin(), bytes.end() );
}

struct payload_reader
{
  std::span< const std::byte > remaining;

  numeric::uint128 amount()
  {
    auto value = numeric::from_little_endian( remaining.first( numeric::uint128_size ) );
    remaining  = remaining.subspan( numeric::uint128_size );
    return *value;
  }

  account caller()
  {
    account a{};
    std::ranges::copy( remaining.first( account_length ), a.begin() );
    remaining = remaining.subspan( account_length );
    return a;
  }
};

} // namespace

std::vector< std::byte > curve_initialized::encode() const
{
  std::vector< std::byte > data;
  data.reserve( payload_size );
  append( data, base_supply );
  append( data, base_balance );
  append( data, caller );
  return data;
}

result< curve_initialized > curve_initialized::decode( std::span< const std::byte > data )
{
  if( data.size() != payload_size )
    return std::unexpected( protocol_errc::malformed_event );

  payload_reader reader{ data };
  curve_initialized payload;
  payload.base_supply  = reader.amount();
  payload.base_balance = reader.amount();
  payload.caller       = reader.caller();
  return payload;
}

std::vector< std::byte > token_purchased::encode() const
{
  std::vector< std::byte > data;
  data.reserve( payload_size );
  append( data, vstoken_amount );
  append( data, token_amount );
  append( data, buyer );
  return data;
}

result< token_purchased > token_purchased::decode( std::span< const std::byte > data )
{
  if( data.size() != payload_size )
    return std::unexpected( protocol_errc::malformed_event );

  payload_reader reader{ data };
  token_purchased payload;
  payload.vstoken_amount = reader.amount();
  payload.token_amount   = reader.amount();
  payload.buyer          = reader.caller();
  return payload;
}

std::vector< std::byte > token_sold::encode() const
{
  std::vector< std::byte > data;
  data.reserve( payload_size );
  append( data, token_amount );
  append( data, vstoken_amount );
  append( data, seller );
  return data;
}

result< token_sold > token_sold::decode( std::span< const std::byte > data )
{
  if( data.size() != payload_size )
    return std::unexpected( protocol_errc::malformed_event );

  payload_reader reader{ data };
  token_sold payload;
  payload.token_amount   = reader.amount();
  payload.vstoken_amount = reader.amount();
  payload.seller         = reader.caller();
  return payload;
}

} // namespace bondcurve::protocol
