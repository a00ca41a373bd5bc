#include <vapp/config/stf_config.hpp>

#include <vapp/config/options.hpp>
#include <vapp/encode.hpp>
#include <vapp/log.hpp>
#include <vapp/numeric/fee.hpp>

namespace vapp::config {

namespace {

result< crypto::digest > parse_domain( const std::string& value )
{
  auto domain = encode::from_hex< crypto::digest_length >( value );
  if( !domain )
    return std::unexpected( config_errc::invalid_domain );

  return *domain;
}

result< numeric::uint256 > parse_protocol_fee( const std::string& value )
{
  if( value.empty() || value.find_first_not_of( "0123456789" ) != std::string::npos || value.size() > 5 )
    return std::unexpected( config_errc::invalid_protocol_fee );

  numeric::uint256 bips( value.c_str() );
  if( bips > numeric::basis_points_denominator )
    return std::unexpected( config_errc::invalid_protocol_fee );

  return bips;
}

} // namespace

result< stf_config > load_config( const YAML::Node& document, const boost::program_options::variables_map& args )
{
  stf_config config;

  try
  {
    YAML::Node service_config;
    YAML::Node global_config;

    if( document && document.IsMap() )
    {
      service_config = document[ constants::service_name ];
      global_config  = document[ constants::global_name ];
    }

    auto domain = get_option< std::string >( constants::domain_option, "", args, service_config, global_config );
    if( !domain.empty() )
    {
      auto parsed = parse_domain( domain );
      if( !parsed )
        return std::unexpected( parsed.error() );

      config.domain = *parsed;
    }

    auto fee = get_option< std::string >( constants::protocol_fee_bips_option, "", args, service_config, global_config );
    if( !fee.empty() )
    {
      auto parsed = parse_protocol_fee( fee );
      if( !parsed )
        return std::unexpected( parsed.error() );

      config.protocol_fee_bips = *parsed;
    }

    config.require_prior_proof =
      get_option< bool >( constants::require_prior_proof_option, false, args, service_config, global_config );

    config.log_level = get_option< std::string >( constants::log_level_option,
                                                  constants::log_level_default,
                                                  args,
                                                  service_config,
                                                  global_config );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Failed to read configuration: {}", e.what() );
    return std::unexpected( config_errc::parse_error );
  }

  if( !log::level_from_string( config.log_level ) )
    return std::unexpected( config_errc::invalid_log_level );

  return config;
}

result< stf_config > load_config( const std::filesystem::path& path, const boost::program_options::variables_map& args )
{
  if( !std::filesystem::exists( path ) )
    return std::unexpected( config_errc::file_not_found );

  YAML::Node document;

  try
  {
    document = YAML::LoadFile( path.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Failed to parse {}: {}", path.string(), e.what() );
    return std::unexpected( config_errc::parse_error );
  }

  return load_config( document, args );
}

} // namespace vapp::config
