#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>

#include <bondcurve/numeric.hpp>
#include <bondcurve/program/error.hpp>
#include <bondcurve/program/pricing.hpp>
#include <bondcurve/program/system_interface.hpp>
#include <bondcurve/protocol.hpp>

namespace bondcurve::program {

namespace space {

constexpr std::uint32_t base_supply  = 0;
constexpr std::uint32_t base_balance = 1;
constexpr std::uint32_t real_supply  = 2;
constexpr std::uint32_t real_balance = 3;
constexpr std::uint32_t ledger       = 4;

} // namespace space

/**
 * Exchange between VSToken and Token along a square root bonding curve.
 *
 * The curve keeps no state of its own. Every call reads and writes through
 * the supplied system interface, and a failed call writes nothing.
 */
struct bonding_curve final
{
  bonding_curve()                       = default;
  bonding_curve( const bonding_curve& ) = delete;
  bonding_curve( bonding_curve&& )      = delete;
  ~bonding_curve()                      = default;

  bonding_curve& operator=( const bonding_curve& ) = delete;
  bonding_curve& operator=( bonding_curve&& )      = delete;

  /**
   * Seeds the curve with a virtual reserve. Succeeds without effect when the
   * curve already exists.
   */
  std::error_code
  initialize( system_interface* system, const protocol::account& caller, const numeric::uint128& reserve ) const;

  /**
   * Deposits VSToken and credits the caller with the minted tokens.
   */
  result< numeric::uint128 >
  buy( system_interface* system, const protocol::account& caller, const numeric::uint128& vstoken_amount ) const;

  /**
   * Burns the caller's tokens and returns the VSToken they redeem for.
   */
  result< numeric::uint128 >
  sell( system_interface* system, const protocol::account& caller, const numeric::uint128& token_amount ) const;

  result< curve_state > state( system_interface* system ) const;
  result< numeric::uint128 > balance_of( system_interface* system, const protocol::account& account ) const;
  result< numeric::uint128 > quote_buy( system_interface* system, const numeric::uint128& vstoken_amount ) const;
  result< numeric::uint128 > quote_sell( system_interface* system, const numeric::uint128& token_amount ) const;

private:
  std::error_code store_balance( system_interface* system,
                                 const protocol::account& account,
                                 const numeric::uint128& balance ) const;
  std::error_code store_reserves( system_interface* system, const curve_state& state ) const;
};

} // namespace bondcurve::program
