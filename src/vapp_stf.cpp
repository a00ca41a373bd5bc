#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <vapp/config.hpp>
#include <vapp/encode.hpp>
#include <vapp/log.hpp>
#include <vapp/protocol.hpp>
#include <vapp/stf.hpp>
#include <vapp/verifier.hpp>

namespace constants {

using namespace std::string_literals;

const auto help_option    = "help,h"s;
const auto version_option = "version,v"s;
const auto input_option   = "input,i"s;
const auto output_option  = "output,o"s;
const auto config_option  = "config,c"s;

} // namespace constants

using namespace boost;
using namespace vapp;

namespace {

const std::string& version_string()
{
  static const std::string v_str = "vapp STF v" + std::string( VAPP_VERSION );
  return v_str;
}

std::vector< std::byte > read_file( const std::filesystem::path& path )
{
  std::ifstream ifs( path, std::ios::binary );
  if( !ifs )
    throw std::runtime_error( "unable to open " + path.string() );

  std::vector< char > chars{ std::istreambuf_iterator< char >( ifs ), std::istreambuf_iterator< char >() };
  std::vector< std::byte > bytes( chars.size() );
  std::ranges::transform( chars, bytes.begin(), []( char c ) { return static_cast< std::byte >( c ); } );
  return bytes;
}

void write_file( const std::filesystem::path& path, std::span< const std::byte > bytes )
{
  std::ofstream ofs( path, std::ios::binary | std::ios::trunc );
  if( !ofs )
    throw std::runtime_error( "unable to open " + path.string() );

  ofs.write( reinterpret_cast< const char* >( bytes.data() ), static_cast< std::streamsize >( bytes.size() ) );
  if( !ofs )
    throw std::runtime_error( "unable to write " + path.string() );
}

} // namespace

int main( int argc, char** argv )
{
  std::filesystem::path input_file, output_file;
  config::stf_config stf_config;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()                        , "Print this help message and exit" )
      ( constants::version_option.data()                     , "Print version string and exit" )
      ( constants::input_option.data()                       , program_options::value< std::string >(), "The serialized transition input" )
      ( constants::output_option.data()                      , program_options::value< std::string >(), "Where to write the encoded public values" )
      ( constants::config_option.data()                      , program_options::value< std::string >(), "The configuration file" )
      ( config::constants::log_level_option.data()           , program_options::value< std::string >(), "The log filtering level" )
      ( config::constants::domain_option.data()              , program_options::value< std::string >(), "The expected signing domain (hex)" )
      ( config::constants::protocol_fee_bips_option.data()   , program_options::value< std::string >(), "The expected protocol fee in basis points" )
      ( config::constants::require_prior_proof_option.data() , program_options::value< bool >()       , "Reject inputs that do not carry a prior step" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( config::option_name( constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( config::option_name( constants::version_option ) ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    if( !args.count( config::option_name( constants::input_option ) ) )
      throw std::runtime_error( "an input file is required" );

    if( !args.count( config::option_name( constants::output_option ) ) )
      throw std::runtime_error( "an output file is required" );

    input_file  = args[ config::option_name( constants::input_option ) ].as< std::string >();
    output_file = args[ config::option_name( constants::output_option ) ].as< std::string >();

    auto loaded = args.count( config::option_name( constants::config_option ) )
                    ? config::load_config(
                        std::filesystem::path( args[ config::option_name( constants::config_option ) ].as< std::string >() ),
                        args )
                    : config::load_config( YAML::Node(), args );

    if( !loaded )
      throw std::runtime_error( "invalid configuration: " + loaded.error().message() );

    stf_config = *loaded;
  }
  catch( const std::exception& e )
  {
    log::initialize();
    LOG_ERROR( log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  log::initialize( log::level_from_string( stf_config.log_level ).value_or( quill::LogLevel::Info ) );
  LOG_INFO( log::instance(), "{}", version_string() );

  try
  {
    auto input = protocol::from_binary< stf::transition_input >( read_file( input_file ) );
    if( !input )
    {
      LOG_ERROR( log::instance(), "Unable to decode transition input from {}", input_file.string() );
      return EXIT_FAILURE;
    }

    LOG_INFO( log::instance(),
              "Applying {} transactions at timestamp {}",
              input->transactions.size(),
              input->timestamp );

    verifier::mock_verifier v;
    stf::apply_options options{ .require_prior_proof = stf_config.require_prior_proof,
                                .domain              = stf_config.domain,
                                .protocol_fee_bips   = stf_config.protocol_fee_bips };

    auto output = stf::apply( *input, v, options );
    if( !output )
    {
      LOG_ERROR( log::instance(), "State transition failed: {}", output.error().message() );
      return EXIT_FAILURE;
    }

    write_file( output_file, output->encoded_public_values );

    LOG_INFO( log::instance(),
              "Transitioned {} to {} with {} receipts",
              log::hex_of( output->public_values.old_root ),
              log::hex_of( output->new_root ),
              output->public_values.receipts.size() );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( log::instance(), "An unexpected error has occurred: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
