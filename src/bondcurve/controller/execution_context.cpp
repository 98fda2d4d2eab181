#include <bondcurve/controller/execution_context.hpp>

#include <stdexcept>
#include <utility>
#include <variant>

namespace bondcurve::controller {

namespace {

state_db::object_space create_object_space( std::uint32_t id )
{
  return state_db::object_space{ .id = id };
}

} // namespace

execution_context::execution_context( const program::bonding_curve& curve, controller::intent intent ):
    _curve( curve ),
    _intent( intent )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

result< protocol::receipt > execution_context::apply( const protocol::operation& o )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( controller_errc::read_only_context );

  _events.clear();

  protocol::receipt receipt;

  if( std::holds_alternative< protocol::initialize_curve >( o ) )
  {
    const auto& op = std::get< protocol::initialize_curve >( o );
    if( auto error = _curve.initialize( this, op.caller, op.reserve ); error )
      return std::unexpected( error );
  }
  else if( std::holds_alternative< protocol::buy_token >( o ) )
  {
    const auto& op = std::get< protocol::buy_token >( o );
    auto minted    = _curve.buy( this, op.caller, op.vstoken_amount );
    if( !minted )
      return std::unexpected( minted.error() );

    receipt.amount = *minted;
  }
  else if( std::holds_alternative< protocol::sell_token >( o ) )
  {
    const auto& op = std::get< protocol::sell_token >( o );
    auto returned  = _curve.sell( this, op.caller, op.token_amount );
    if( !returned )
      return std::unexpected( returned.error() );

    receipt.amount = *returned;
  }
  else [[unlikely]]
  {
    throw std::runtime_error( "unknown operation" );
  }

  receipt.events = std::move( _events );
  _events.clear();

  return receipt;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return controller_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return controller_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return controller_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return controller_errc::ok;
}

std::error_code execution_context::emit_event( protocol::event&& e )
{
  if( _intent == intent::read_only )
    return controller_errc::read_only_context;

  e.sequence = static_cast< std::uint32_t >( _events.size() );
  _events.emplace_back( std::move( e ) );

  return controller_errc::ok;
}

} // namespace bondcurve::controller
