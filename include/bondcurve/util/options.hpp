#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace bondcurve::util {

/**
 * Resolve an option by precedence: command line, then the service section of
 * the config file, then its global section, then the default.
 *
 * The key may carry a short name ("log-level,l"); only the long name is looked
 * up.
 */
template< typename T >
T get_option( std::string key,
              const T& default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.erase( pos );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

} // namespace bondcurve::util
