#pragma once

#include <string>

#include <boost/program_options/variables_map.hpp>
#include <yaml-cpp/yaml.h>

namespace vapp::config {

// Strips the short form from a program_options key, "log-level,l" becomes "log-level".
std::string option_name( const std::string& key );

/*
 * Resolves an option from the command line, then the service section of the
 * configuration file, then its global section, and falls back to default_value.
 */
template< typename T >
T get_option( const std::string& key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto name = option_name( key );

  if( args.count( name ) )
    return args[ name ].as< T >();

  if( service_config && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

} // namespace vapp::config
