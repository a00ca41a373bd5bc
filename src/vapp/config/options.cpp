#include <vapp/config/options.hpp>

namespace vapp::config {

std::string option_name( const std::string& key )
{
  return key.substr( 0, key.find( ',' ) );
}

} // namespace vapp::config
