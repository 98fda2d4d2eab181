#include <bondcurve/controller/controller.hpp>
#include <bondcurve/controller/execution_context.hpp>

#include <bondcurve/log.hpp>

#include <exception>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace bondcurve::controller {

namespace {

std::string_view operation_name( const protocol::operation& o )
{
  if( std::holds_alternative< protocol::initialize_curve >( o ) )
    return "initialize";
  if( std::holds_alternative< protocol::buy_token >( o ) )
    return "buy";

  return "sell";
}

const protocol::account& operation_caller( const protocol::operation& o )
{
  return std::visit(
    []( const auto& op ) -> const protocol::account&
    {
      return op.caller;
    },
    o );
}

} // namespace

controller::controller() = default;

controller::~controller()
{
  close();
}

std::error_code controller::open( const std::optional< std::filesystem::path >& p, bool reset )
{
  std::unique_lock lock( _mutex );

  if( auto error = _db.open( p ); error )
  {
    LOG_ERROR( bondcurve::log::instance(), "Could not open database: {}", error.message() );
    return error;
  }

  if( reset )
  {
    LOG_INFO( bondcurve::log::instance(), "Resetting database..." );
    if( auto error = _db.reset(); error )
      return error;
  }

  LOG_INFO( bondcurve::log::instance(),
            "Opened database at revision {} ({})",
            _db.head()->revision(),
            p ? p->string() : std::string( "in memory" ) );

  return controller_errc::ok;
}

void controller::close()
{
  std::unique_lock lock( _mutex );
  _db.close();
}

result< protocol::receipt > controller::process( const protocol::operation& operation )
{
  std::unique_lock lock( _mutex );

  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  auto node = _db.head()->make_child();

  execution_context context( _curve, intent::operation_application );
  context.set_state_node( node );

  auto receipt = context.apply( operation );
  context.clear_state_node();

  const auto& caller = operation_caller( operation );

  if( !receipt )
  {
    LOG_DEBUG( bondcurve::log::instance(),
               "Rejected {} from {}: {}",
               operation_name( operation ),
               bondcurve::log::hex{ caller.data(), caller.size() },
               receipt.error().message() );
    return receipt;
  }

  if( auto error = _db.commit( node ); error )
  {
    LOG_WARNING( bondcurve::log::instance(),
                 "Could not commit {} from {}: {}",
                 operation_name( operation ),
                 bondcurve::log::hex{ caller.data(), caller.size() },
                 error.message() );
    return std::unexpected( error );
  }

  LOG_DEBUG( bondcurve::log::instance(),
             "Applied {} from {} - Amount: {}, Revision: {}",
             operation_name( operation ),
             bondcurve::log::hex{ caller.data(), caller.size() },
             receipt->amount,
             _db.head()->revision() );

  // The operation is committed, a failing subscriber cannot undo it
  for( const auto& event: receipt->events )
  {
    for( const auto& handler: _handlers )
    {
      try
      {
        handler( event );
      }
      catch( const std::exception& e )
      {
        LOG_WARNING( bondcurve::log::instance(), "Event handler failed: {}", e.what() );
      }
    }
  }

  return receipt;
}

template< typename Query >
auto controller::query( Query&& q ) const
{
  std::shared_lock lock( _mutex );

  using result_type = std::invoke_result_t< Query, execution_context* >;

  if( !_db.is_open() )
    return result_type( std::unexpected( controller_errc::not_open ) );

  execution_context context( _curve );
  context.set_state_node( _db.head() );
  return result_type( std::forward< Query >( q )( &context ) );
}

result< program::curve_state > controller::curve_state() const
{
  return query(
    [ & ]( execution_context* context )
    {
      return _curve.state( context );
    } );
}

result< numeric::uint128 > controller::balance_of( const protocol::account& account ) const
{
  return query(
    [ & ]( execution_context* context )
    {
      return _curve.balance_of( context, account );
    } );
}

result< numeric::uint128 > controller::quote_buy( const numeric::uint128& vstoken_amount ) const
{
  return query(
    [ & ]( execution_context* context )
    {
      return _curve.quote_buy( context, vstoken_amount );
    } );
}

result< numeric::uint128 > controller::quote_sell( const numeric::uint128& token_amount ) const
{
  return query(
    [ & ]( execution_context* context )
    {
      return _curve.quote_sell( context, token_amount );
    } );
}

void controller::subscribe( event_handler handler )
{
  std::unique_lock lock( _mutex );
  _handlers.emplace_back( std::move( handler ) );
}

} // namespace bondcurve::controller
