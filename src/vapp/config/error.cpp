#include <vapp/config/error.hpp>

#include <string>
#include <utility>

namespace vapp::config {

struct _config_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "config";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< config_errc >( condition ) )
    {
      case config_errc::ok:
        return "ok"s;
      case config_errc::file_not_found:
        return "configuration file not found"s;
      case config_errc::parse_error:
        return "configuration could not be parsed"s;
      case config_errc::invalid_domain:
        return "domain must be 32 hex encoded bytes"s;
      case config_errc::invalid_protocol_fee:
        return "protocol fee must be a number of basis points no greater than 10000"s;
      case config_errc::invalid_log_level:
        return "unknown log level"s;
    }
    std::unreachable();
  }
};

const std::error_category& config_category() noexcept
{
  static _config_category category;
  return category;
}

std::error_code make_error_code( config_errc e )
{
  return std::error_code( static_cast< int >( e ), config_category() );
}

} // namespace vapp::config
