#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <boost/program_options/variables_map.hpp>
#include <yaml-cpp/yaml.h>

#include <vapp/config/error.hpp>
#include <vapp/crypto/hash.hpp>
#include <vapp/numeric/checked.hpp>

namespace vapp::config {

namespace constants {

using namespace std::string_literals;

const auto service_name = "stf"s;
const auto global_name  = "global"s;

const auto domain_option              = "domain"s;
const auto protocol_fee_bips_option   = "protocol-fee-bips"s;
const auto require_prior_proof_option = "require-prior-proof"s;
const auto log_level_option           = "log-level,l"s;
const auto log_level_default          = "info"s;

} // namespace constants

struct stf_config
{
  std::optional< crypto::digest > domain;
  std::optional< numeric::uint256 > protocol_fee_bips;
  bool require_prior_proof = false;
  std::string log_level    = constants::log_level_default;
};

/*
 * Reads the "stf" section of a configuration document, falling back to its "global"
 * section. Values present in args take precedence over the document.
 */
result< stf_config > load_config( const YAML::Node& document, const boost::program_options::variables_map& args );
result< stf_config > load_config( const std::filesystem::path& path, const boost::program_options::variables_map& args );

} // namespace vapp::config
