#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <bondcurve/controller.hpp>
#include <bondcurve/log.hpp>
#include <bondcurve/numeric.hpp>
#include <bondcurve/protocol.hpp>
#include <bondcurve/util/options.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service = "bondcurve"s;

constexpr auto help_option       = "help,h"s;
constexpr auto version_option    = "version,v"s;
constexpr auto basedir_option    = "basedir,d"s;
constexpr auto basedir_default   = ".bondcurve"s;
constexpr auto statedir_option   = "statedir"s;
constexpr auto statedir_default  = "state"s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;
constexpr auto caller_option     = "caller,c"s;
constexpr auto initialize_option = "initialize"s;
constexpr auto buy_option        = "buy"s;
constexpr auto sell_option       = "sell"s;
constexpr auto quote_buy_option  = "quote-buy"s;
constexpr auto quote_sell_option = "quote-sell"s;
constexpr auto balance_option    = "balance"s;
constexpr auto reset_option      = "reset"s;
constexpr auto reset_default     = false;

} // namespace constants

using namespace bondcurve;

namespace {

const std::string& version_string()
{
  static const std::string v_str = "bondcurve v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                                   + std::to_string( PROJECT_MINOR_VERSION ) + "."
                                   + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}

std::filesystem::path default_base_directory()
{
  if( const char* home = std::getenv( "HOME" ); home != nullptr )
    return std::filesystem::path( home ) / constants::basedir_default;

  return std::filesystem::current_path() / constants::basedir_default;
}

std::optional< std::string > cli_value( const boost::program_options::variables_map& args, std::string key )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.erase( pos );

  if( !args.count( key ) )
    return {};

  return args[ key ].as< std::string >();
}

numeric::uint128 parse_amount( const std::string& option, const std::string& text )
{
  auto amount = numeric::from_string( text );
  if( !amount )
    throw std::runtime_error( "invalid amount for --" + option + ": " + amount.error().message() );

  return *amount;
}

protocol::account parse_account( const std::string& option, const std::string& text )
{
  auto account = protocol::account_from_hex( text );
  if( !account )
    throw std::runtime_error( "invalid account for --" + option + ": " + account.error().message() );

  return *account;
}

void print_event( const protocol::event& e )
{
  if( auto payload = protocol::event_payload< protocol::curve_initialized >( e ); payload )
    std::println( "event {} {}: base_supply={} base_balance={} caller={}",
                  e.sequence,
                  e.name,
                  payload->base_supply.str(),
                  payload->base_balance.str(),
                  protocol::to_hex( payload->caller ) );
  else if( auto payload = protocol::event_payload< protocol::token_purchased >( e ); payload )
    std::println( "event {} {}: vstoken_amount={} token_amount={} buyer={}",
                  e.sequence,
                  e.name,
                  payload->vstoken_amount.str(),
                  payload->token_amount.str(),
                  protocol::to_hex( payload->buyer ) );
  else if( auto payload = protocol::event_payload< protocol::token_sold >( e ); payload )
    std::println( "event {} {}: token_amount={} vstoken_amount={} seller={}",
                  e.sequence,
                  e.name,
                  payload->token_amount.str(),
                  payload->vstoken_amount.str(),
                  protocol::to_hex( payload->seller ) );
  else
    std::println( "event {} {}", e.sequence, e.name );
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path statedir;
  bool reset = false;
  boost::program_options::variables_map args;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()      , "Print this help message and exit" )
      ( constants::version_option.data()   , "Print version string and exit" )
      ( constants::basedir_option.data()   , boost::program_options::value< std::string >()->default_value( default_base_directory().string() ), "The base directory" )
      ( constants::statedir_option.data()  , boost::program_options::value< std::string >(), "The location of the state files (absolute path or relative to basedir/bondcurve)" )
      ( constants::log_level_option.data() , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::reset_option.data()     , boost::program_options::value< bool >()->implicit_value( true ), "Reset the database" )
      ( constants::caller_option.data()    , boost::program_options::value< std::string >(), "The calling account as 64 hex digits" )
      ( constants::initialize_option.data(), boost::program_options::value< std::string >(), "Initialize the curve with a VSToken reserve" )
      ( constants::buy_option.data()       , boost::program_options::value< std::string >(), "Buy tokens with an amount of VSToken" )
      ( constants::sell_option.data()      , boost::program_options::value< std::string >(), "Sell an amount of tokens for VSToken" )
      ( constants::quote_buy_option.data() , boost::program_options::value< std::string >(), "Quote the tokens minted for an amount of VSToken" )
      ( constants::quote_sell_option.data(), boost::program_options::value< std::string >(), "Quote the VSToken returned for an amount of tokens" )
      ( constants::balance_option.data()   , boost::program_options::value< std::string >(), "Print the token balance of an account" );
    // clang-format on

    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "{}", version_string() );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      global_config  = config[ "global" ];
      service_config = config[ constants::service ];
    }

    // clang-format off
    log_level = util::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    statedir  = std::filesystem::path( util::get_option< std::string >( constants::statedir_option, constants::statedir_default, args, service_config, global_config ) );
    reset     = util::get_option< bool >( constants::reset_option, constants::reset_default, args, service_config, global_config );
    // clang-format on

    bondcurve::log::initialize();
    bondcurve::log::set_level( log_level );

    LOG_INFO( bondcurve::log::instance(), "{}", version_string() );

    if( config.IsNull() )
      LOG_WARNING( bondcurve::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( statedir.is_relative() )
      statedir = basedir / constants::service / statedir;
  }
  catch( const std::exception& e )
  {
    std::println( std::cerr, "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller;

  try
  {
    if( auto error = controller.open( statedir, reset ); error )
      throw std::runtime_error( "could not open state at " + statedir.string() + ": " + error.message() );

    controller.subscribe( print_event );

    auto caller = [ & ]() -> protocol::account
    {
      auto text = cli_value( args, constants::caller_option );
      if( !text )
        throw std::runtime_error( "--caller is required to initialize, buy or sell" );

      return parse_account( "caller", *text );
    };

    std::vector< protocol::operation > operations;

    if( auto text = cli_value( args, constants::initialize_option ); text )
      operations.emplace_back( protocol::initialize_curve{ caller(), parse_amount( "initialize", *text ) } );

    if( auto text = cli_value( args, constants::buy_option ); text )
      operations.emplace_back( protocol::buy_token{ caller(), parse_amount( "buy", *text ) } );

    if( auto text = cli_value( args, constants::sell_option ); text )
      operations.emplace_back( protocol::sell_token{ caller(), parse_amount( "sell", *text ) } );

    for( const auto& operation: operations )
    {
      auto receipt = controller.process( operation );
      if( !receipt )
        throw std::runtime_error( "operation failed: " + receipt.error().message() );

      std::println( "amount {}", receipt->amount.str() );
    }

    if( auto text = cli_value( args, constants::quote_buy_option ); text )
    {
      auto minted = controller.quote_buy( parse_amount( "quote-buy", *text ) );
      if( !minted )
        throw std::runtime_error( "quote failed: " + minted.error().message() );

      std::println( "quote-buy {}", minted->str() );
    }

    if( auto text = cli_value( args, constants::quote_sell_option ); text )
    {
      auto returned = controller.quote_sell( parse_amount( "quote-sell", *text ) );
      if( !returned )
        throw std::runtime_error( "quote failed: " + returned.error().message() );

      std::println( "quote-sell {}", returned->str() );
    }

    if( auto text = cli_value( args, constants::balance_option ); text )
    {
      auto balance = controller.balance_of( parse_account( "balance", *text ) );
      if( !balance )
        throw std::runtime_error( "balance query failed: " + balance.error().message() );

      std::println( "balance {}", balance->str() );
    }

    if( auto state = controller.curve_state(); state )
      std::println( "state base_supply={} base_balance={} real_supply={} real_balance={}",
                    state->base_supply.str(),
                    state->base_balance.str(),
                    state->real_supply.str(),
                    state->real_balance.str() );
    else
      std::println( "state {}", state.error().message() );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( bondcurve::log::instance(), "{}", e.what() );
    retcode = EXIT_FAILURE;
  }

  controller.close();

  return retcode;
}
