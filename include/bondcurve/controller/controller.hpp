#pragma once

#include <bondcurve/controller/error.hpp>
#include <bondcurve/numeric.hpp>
#include <bondcurve/program.hpp>
#include <bondcurve/protocol.hpp>
#include <bondcurve/state_db.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace bondcurve::controller {

using event_handler = std::function< void( const protocol::event& ) >;

/**
 * Hosts a bonding curve on top of a state database.
 *
 * Operations are serialized and applied atomically. Each one runs against a
 * scratch child of head that is committed only when the operation succeeds.
 * Queries may run concurrently with each other but not with an operation.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Open the state database. Without a path, state lives in memory only.
   */
  std::error_code open( const std::optional< std::filesystem::path >& p, bool reset = false );
  void close();

  result< protocol::receipt > process( const protocol::operation& operation );

  result< program::curve_state > curve_state() const;
  result< numeric::uint128 > balance_of( const protocol::account& account ) const;
  result< numeric::uint128 > quote_buy( const numeric::uint128& vstoken_amount ) const;
  result< numeric::uint128 > quote_sell( const numeric::uint128& token_amount ) const;

  /**
   * Registers a handler for the events of every committed operation.
   *
   * Handlers run on the processing thread while the controller is locked and
   * must not call back in to the controller. An exception thrown by a handler
   * is logged and does not fail the operation, which is already committed.
   */
  void subscribe( event_handler handler );

private:
  template< typename Query >
  auto query( Query&& q ) const;

  state_db::database _db;
  program::bonding_curve _curve;
  std::vector< event_handler > _handlers;
  mutable std::shared_mutex _mutex;
};

} // namespace bondcurve::controller
