// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/filesystem.hpp>

#include <bondcurve/log.hpp>

#include <algorithm>
#include <stdexcept>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  bondcurve::log::initialize();
  bondcurve::log::set_level( log_level );

  _state_dir = std::filesystem::temp_directory_path() / ( name + "_" + boost::filesystem::unique_path().string() );
  LOG_INFO( bondcurve::log::instance(), "Using temporary directory: {}", _state_dir.string() );
  std::filesystem::create_directory( _state_dir );

  _controller = std::make_unique< bondcurve::controller::controller >();
  if( auto error = _controller->open( _state_dir ); error )
    throw std::runtime_error( "could not open controller: " + error.message() );
}

fixture::~fixture()
{
  _controller.reset();
  std::filesystem::remove_all( _state_dir );
}

bondcurve::protocol::account fixture::make_account( std::string_view name )
{
  bondcurve::protocol::account account{};
  std::ranges::transform( name.substr( 0, account.size() ),
                          account.begin(),
                          []( char c )
                          {
                            return static_cast< std::byte >( c );
                          } );
  return account;
}

bondcurve::protocol::operation fixture::make_initialize_operation( const bondcurve::protocol::account& caller,
                                                                   const bondcurve::numeric::uint128& reserve ) const
{
  bondcurve::protocol::initialize_curve op;
  op.caller  = caller;
  op.reserve = reserve;
  return op;
}

bondcurve::protocol::operation fixture::make_buy_operation( const bondcurve::protocol::account& caller,
                                                            const bondcurve::numeric::uint128& vstoken_amount ) const
{
  bondcurve::protocol::buy_token op;
  op.caller         = caller;
  op.vstoken_amount = vstoken_amount;
  return op;
}

bondcurve::protocol::operation fixture::make_sell_operation( const bondcurve::protocol::account& caller,
                                                             const bondcurve::numeric::uint128& token_amount ) const
{
  bondcurve::protocol::sell_token op;
  op.caller       = caller;
  op.token_amount = token_amount;
  return op;
}

void fixture::reopen( bool reset )
{
  _controller->close();
  _controller = std::make_unique< bondcurve::controller::controller >();
  if( auto error = _controller->open( _state_dir, reset ); error )
    throw std::runtime_error( "could not reopen controller: " + error.message() );
}

bondcurve::numeric::uint128
fixture::ledger_total( std::span< const bondcurve::protocol::account > accounts ) const
{
  bondcurve::numeric::uint128 total = 0;
  for( const auto& account: accounts )
  {
    auto balance = _controller->balance_of( account );
    if( !balance )
      throw std::runtime_error( "could not read balance: " + balance.error().message() );

    total += *balance;
  }

  return total;
}

bool fixture::verify( const bondcurve::controller::result< bondcurve::protocol::receipt >& receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( bondcurve::log::instance(), "Operation has failed with: {}", receipt.error().message() );
    return false;
  }

  if( ( flags & verification::with_events ) && receipt->events.empty() )
  {
    LOG_ERROR( bondcurve::log::instance(), "Operation did not emit any events" );
    return false;
  }

  if( ( flags & verification::without_events ) && !receipt->events.empty() )
  {
    LOG_ERROR( bondcurve::log::instance(),
               "Operation emitted {} unexpected events, the first being {}",
               receipt->events.size(),
               receipt->events.front().name );
    return false;
  }

  return true;
}

} // namespace test

// NOLINTEND
