#include <bondcurve/memory.hpp>
#include <bondcurve/program/bonding_curve.hpp>

namespace bondcurve::program {

namespace {

result< std::optional< numeric::uint128 > >
load( system_interface* system, std::uint32_t id, std::span< const std::byte > key = {} )
{
  auto object = system->get_object( id, key );
  if( object.empty() )
    return std::optional< numeric::uint128 >{};

  auto value = numeric::from_little_endian( object );
  if( !value )
    return std::unexpected( program_errc::unexpected_object );

  return std::optional< numeric::uint128 >( *value );
}

std::error_code
store( system_interface* system, std::uint32_t id, const numeric::uint128& value, std::span< const std::byte > key = {} )
{
  auto bytes = numeric::to_little_endian( value );
  return system->put_object( id, key, bytes );
}

} // namespace

std::error_code bonding_curve::initialize( system_interface* system,
                                           const protocol::account& caller,
                                           const numeric::uint128& reserve ) const
{
  auto existing = load( system, space::base_supply );
  if( !existing )
    return existing.error();

  if( existing->has_value() )
    return {};

  auto base_supply = numeric::checked_mul( reserve, 2 );
  if( !base_supply )
    return base_supply.error();

  curve_state initial{ .base_supply = *base_supply, .base_balance = reserve, .real_supply = 0, .real_balance = 0 };

  if( auto error = store( system, space::base_supply, initial.base_supply ); error )
    return error;

  if( auto error = store( system, space::base_balance, initial.base_balance ); error )
    return error;

  if( auto error = store_reserves( system, initial ); error )
    return error;

  return system->emit_event(
    protocol::make_event( protocol::curve_initialized{ initial.base_supply, initial.base_balance, caller }, caller ) );
}

result< numeric::uint128 > bonding_curve::buy( system_interface* system,
                                               const protocol::account& caller,
                                               const numeric::uint128& vstoken_amount ) const
{
  auto current = state( system );
  if( !current )
    return std::unexpected( current.error() );

  auto minted = purchase_return( *current, vstoken_amount );
  if( !minted )
    return minted;

  auto balance = balance_of( system, caller );
  if( !balance )
    return balance;

  // Every counter is checked before anything is written
  auto real_supply = numeric::checked_add( current->real_supply, *minted );
  if( !real_supply )
    return real_supply;

  auto real_balance = numeric::checked_add( current->real_balance, vstoken_amount );
  if( !real_balance )
    return real_balance;

  auto new_balance = numeric::checked_add( *balance, *minted );
  if( !new_balance )
    return new_balance;

  curve_state next   = *current;
  next.real_supply  = *real_supply;
  next.real_balance = *real_balance;

  if( auto error = store_reserves( system, next ); error )
    return std::unexpected( error );

  if( auto error = store_balance( system, caller, *new_balance ); error )
    return std::unexpected( error );

  if( auto error = system->emit_event(
        protocol::make_event( protocol::token_purchased{ vstoken_amount, *minted, caller }, caller ) );
      error )
    return std::unexpected( error );

  return minted;
}

result< numeric::uint128 > bonding_curve::sell( system_interface* system,
                                                const protocol::account& caller,
                                                const numeric::uint128& token_amount ) const
{
  auto current = state( system );
  if( !current )
    return std::unexpected( current.error() );

  auto balance = balance_of( system, caller );
  if( !balance )
    return balance;

  if( *balance < token_amount )
    return std::unexpected( program_errc::insufficient_token_balance );

  auto returned = sale_return( *current, token_amount );
  if( !returned )
    return returned;

  auto real_supply = numeric::checked_sub( current->real_supply, token_amount );
  if( !real_supply )
    return real_supply;

  auto real_balance = numeric::checked_sub( current->real_balance, *returned );
  if( !real_balance )
    return real_balance;

  auto new_balance = numeric::checked_sub( *balance, token_amount );
  if( !new_balance )
    return new_balance;

  curve_state next   = *current;
  next.real_supply  = *real_supply;
  next.real_balance = *real_balance;

  if( auto error = store_reserves( system, next ); error )
    return std::unexpected( error );

  if( auto error = store_balance( system, caller, *new_balance ); error )
    return std::unexpected( error );

  if( auto error = system->emit_event(
        protocol::make_event( protocol::token_sold{ token_amount, *returned, caller }, caller ) );
      error )
    return std::unexpected( error );

  return returned;
}

result< curve_state > bonding_curve::state( system_interface* system ) const
{
  auto base_supply = load( system, space::base_supply );
  if( !base_supply )
    return std::unexpected( base_supply.error() );

  if( !base_supply->has_value() )
    return std::unexpected( program_errc::curve_not_initialized );

  auto base_balance = load( system, space::base_balance );
  if( !base_balance )
    return std::unexpected( base_balance.error() );

  auto real_supply = load( system, space::real_supply );
  if( !real_supply )
    return std::unexpected( real_supply.error() );

  auto real_balance = load( system, space::real_balance );
  if( !real_balance )
    return std::unexpected( real_balance.error() );

  // A curve is written as a whole, so a partial one is corrupt
  if( !base_balance->has_value() || !real_supply->has_value() || !real_balance->has_value() )
    return std::unexpected( program_errc::unexpected_object );

  return curve_state{ .base_supply  = **base_supply,
                      .base_balance = **base_balance,
                      .real_supply  = **real_supply,
                      .real_balance = **real_balance };
}

result< numeric::uint128 > bonding_curve::balance_of( system_interface* system, const protocol::account& account ) const
{
  auto balance = load( system, space::ledger, memory::as_bytes( account ) );
  if( !balance )
    return std::unexpected( balance.error() );

  return balance->value_or( 0 );
}

result< numeric::uint128 > bonding_curve::quote_buy( system_interface* system,
                                                     const numeric::uint128& vstoken_amount ) const
{
  return state( system ).and_then(
    [ & ]( const curve_state& current )
    {
      return purchase_return( current, vstoken_amount );
    } );
}

result< numeric::uint128 > bonding_curve::quote_sell( system_interface* system,
                                                      const numeric::uint128& token_amount ) const
{
  return state( system ).and_then(
    [ & ]( const curve_state& current ) -> result< numeric::uint128 >
    {
      if( token_amount > current.real_supply )
        return std::unexpected( program_errc::insufficient_supply );

      return sale_return( current, token_amount );
    } );
}

std::error_code bonding_curve::store_balance( system_interface* system,
                                              const protocol::account& account,
                                              const numeric::uint128& balance ) const
{
  if( balance == 0 )
    return system->remove_object( space::ledger, memory::as_bytes( account ) );

  return store( system, space::ledger, balance, memory::as_bytes( account ) );
}

std::error_code bonding_curve::store_reserves( system_interface* system, const curve_state& state ) const
{
  if( auto error = store( system, space::real_supply, state.real_supply ); error )
    return error;

  return store( system, space::real_balance, state.real_balance );
}

} // namespace bondcurve::program
