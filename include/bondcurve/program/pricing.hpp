#pragma once

#include <bondcurve/numeric.hpp>
#include <bondcurve/program/error.hpp>

namespace bondcurve::program {

struct curve_state
{
  numeric::uint128 base_supply  = 0;
  numeric::uint128 base_balance = 0;
  numeric::uint128 real_supply  = 0;
  numeric::uint128 real_balance = 0;

  numeric::uint512 virtual_supply() const;
  numeric::uint512 virtual_balance() const;

  bool operator==( const curve_state& ) const = default;
};

/**
 * Tokens minted for a deposit of VSToken, using a connector weight of 1/2:
 *
 *   minted = virtual_supply * ( sqrt( 1 + deposit / virtual_balance ) - 1 )
 */
result< numeric::uint128 > purchase_return( const curve_state& state, const numeric::uint128& deposit );

/**
 * VSToken returned for a sale of tokens:
 *
 *   returned = virtual_balance * ( 1 - ( 1 - amount / virtual_supply )^2 )
 */
result< numeric::uint128 > sale_return( const curve_state& state, const numeric::uint128& amount );

} // namespace bondcurve::program
