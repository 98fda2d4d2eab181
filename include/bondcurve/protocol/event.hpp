#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <bondcurve/numeric/uint128.hpp>
#include <bondcurve/protocol/account.hpp>
#include <bondcurve/protocol/error.hpp>

namespace bondcurve::protocol {

struct event
{
  std::uint32_t sequence = 0;
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;
};

/**
 * Payloads are the concatenation of their fields in declaration order.
 * Amounts take 16 little endian bytes, accounts their 32 raw bytes.
 */
struct curve_initialized
{
  static constexpr std::string_view name = "curve_initialized";

  numeric::uint128 base_supply  = 0;
  numeric::uint128 base_balance = 0;
  account caller{};

  std::vector< std::byte > encode() const;
  static result< curve_initialized > decode( std::span< const std::byte > data );
};

struct token_purchased
{
  static constexpr std::string_view name = "token_purchased";

  numeric::uint128 vstoken_amount = 0;
  numeric::uint128 token_amount   = 0;
  account buyer{};

  std::vector< std::byte > encode() const;
  static result< token_purchased > decode( std::span< const std::byte > data );
};

struct token_sold
{
  static constexpr std::string_view name = "token_sold";

  numeric::uint128 token_amount   = 0;
  numeric::uint128 vstoken_amount = 0;
  account seller{};

  std::vector< std::byte > encode() const;
  static result< token_sold > decode( std::span< const std::byte > data );
};

template< typename Payload >
event make_event( const Payload& payload, const account& impacted )
{
  event e;
  e.name = std::string( Payload::name );
  e.data = payload.encode();
  e.impacted.push_back( impacted );
  return e;
}

template< typename Payload >
result< Payload > event_payload( const event& e )
{
  if( e.name != Payload::name )
    return std::unexpected( protocol_errc::unexpected_event );

  return Payload::decode( e.data );
}

} // namespace bondcurve::protocol
