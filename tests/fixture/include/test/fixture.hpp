#pragma once

#include <bondcurve/controller.hpp>
#include <bondcurve/numeric.hpp>
#include <bondcurve/protocol.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static bondcurve::protocol::account make_account( std::string_view name );

  bondcurve::protocol::operation make_initialize_operation( const bondcurve::protocol::account& caller,
                                                            const bondcurve::numeric::uint128& reserve ) const;
  bondcurve::protocol::operation make_buy_operation( const bondcurve::protocol::account& caller,
                                                     const bondcurve::numeric::uint128& vstoken_amount ) const;
  bondcurve::protocol::operation make_sell_operation( const bondcurve::protocol::account& caller,
                                                      const bondcurve::numeric::uint128& token_amount ) const;

  /**
   * Close the controller and open a fresh one on the same state directory.
   */
  void reopen( bool reset = false );

  /**
   * Sum of the ledger balances of the given accounts.
   */
  bondcurve::numeric::uint128 ledger_total( std::span< const bondcurve::protocol::account > accounts ) const;

  enum verification : std::uint_fast8_t
  {
    none           = 0,
    processed      = 1 << 0,
    with_events    = 1 << 1,
    without_events = 1 << 2
  };

  bool verify( const bondcurve::controller::result< bondcurve::protocol::receipt >& receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< bondcurve::controller::controller > _controller;
  std::filesystem::path _state_dir;
};

} // namespace test
