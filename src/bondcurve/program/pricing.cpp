#include <bondcurve/program/pricing.hpp>

namespace bondcurve::program {

using numeric::fixed_point;

numeric::uint512 curve_state::virtual_supply() const
{
  return numeric::uint512( base_supply ) + numeric::uint512( real_supply );
}

numeric::uint512 curve_state::virtual_balance() const
{
  return numeric::uint512( base_balance ) + numeric::uint512( real_balance );
}

result< numeric::uint128 > purchase_return( const curve_state& state, const numeric::uint128& deposit )
{
  return fixed_point::from_ratio( numeric::uint512( deposit ), state.virtual_balance() )
    .and_then(
      []( const fixed_point& ratio )
      {
        return fixed_point::one().add( ratio );
      } )
    .and_then(
      []( const fixed_point& scale )
      {
        return scale.sqrt();
      } )
    .and_then(
      []( const fixed_point& root )
      {
        return root.sub( fixed_point::one() );
      } )
    .and_then(
      [ & ]( const fixed_point& growth )
      {
        return fixed_point::from_integer( state.virtual_supply() )
          .and_then(
            [ & ]( const fixed_point& supply )
            {
              return growth.mul( supply );
            } );
      } )
    .and_then(
      []( const fixed_point& minted )
      {
        return minted.truncate();
      } );
}

result< numeric::uint128 > sale_return( const curve_state& state, const numeric::uint128& amount )
{
  return fixed_point::from_ratio( numeric::uint512( amount ), state.virtual_supply() )
    .and_then(
      []( const fixed_point& share )
      {
        return fixed_point::one().sub( share );
      } )
    .and_then(
      []( const fixed_point& remaining )
      {
        return remaining.mul( remaining );
      } )
    .and_then(
      []( const fixed_point& squared )
      {
        return fixed_point::one().sub( squared );
      } )
    .and_then(
      [ & ]( const fixed_point& drop )
      {
        return fixed_point::from_integer( state.virtual_balance() )
          .and_then(
            [ & ]( const fixed_point& balance )
            {
              return drop.mul( balance );
            } );
      } )
    .and_then(
      []( const fixed_point& returned )
      {
        return returned.truncate();
      } );
}

} // namespace bondcurve::program
