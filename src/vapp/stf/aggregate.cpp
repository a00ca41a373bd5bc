#include <vapp/stf/aggregate.hpp>

#include <iterator>
#include <optional>
#include <utility>

#include <vapp/log.hpp>
#include <vapp/protocol/serialization.hpp>

namespace vapp::stf {

result< step_public_values > aggregate( const verifier::vk_digest& vk,
                                        std::span< const std::vector< std::byte > > steps,
                                        const verifier::verifier& v )
{
  if( steps.empty() )
    return std::unexpected( stf_errc::empty_aggregation );

  std::optional< step_public_values > aggregated;

  for( const auto& encoded: steps )
  {
    if( !v.verify( vk, public_values_digest( encoded ) ) )
      return std::unexpected( stf_errc::invalid_proof );

    auto step = protocol::from_binary< step_public_values >( encoded );
    if( !step )
      return std::unexpected( stf_errc::malformed_public_values );

    if( !aggregated )
    {
      aggregated = std::move( *step );
      continue;
    }

    if( step->old_root != aggregated->new_root )
      return std::unexpected( stf_errc::root_mismatch );

    if( step->timestamp < aggregated->timestamp )
      return std::unexpected( stf_errc::timestamp_out_of_order );

    aggregated->new_root      = step->new_root;
    aggregated->accounts_root = step->accounts_root;
    aggregated->requests_root = step->requests_root;
    aggregated->timestamp     = step->timestamp;
    aggregated->receipts.insert( aggregated->receipts.end(),
                                 std::make_move_iterator( step->receipts.begin() ),
                                 std::make_move_iterator( step->receipts.end() ) );
  }

  LOG_INFO( log::instance(),
            "Aggregated {} steps with {} receipts",
            steps.size(),
            aggregated->receipts.size() );

  return std::move( *aggregated );
}

} // namespace vapp::stf
