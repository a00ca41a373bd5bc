#include <vapp/stf/apply.hpp>

#include <span>
#include <utility>

#include <vapp/log.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/protocol/serialization.hpp>
#include <vapp/state/proof.hpp>
#include <vapp/stf/execute.hpp>

namespace vapp::stf {

namespace {

result< void > check_prior( const transition_input& input, const verifier::verifier& v, const apply_options& options )
{
  if( !input.prior )
  {
    if( options.require_prior_proof )
      return std::unexpected( stf_errc::missing_prior_step );

    return {};
  }

  if( !v.verify( input.prior->vk, public_values_digest( input.prior->public_values ) ) )
    return std::unexpected( stf_errc::invalid_proof );

  auto prior = protocol::from_binary< step_public_values >( input.prior->public_values );
  if( !prior )
    return std::unexpected( stf_errc::malformed_public_values );

  if( prior->new_root != input.root )
    return std::unexpected( stf_errc::invalid_proof );

  if( prior->timestamp > input.timestamp )
    return std::unexpected( stf_errc::timestamp_out_of_order );

  return {};
}

result< void > check_parameters( const transition_input& input, const apply_options& options )
{
  if( options.domain && *options.domain != input.state.domain )
    return std::unexpected( stf_errc::domain_mismatch );

  if( options.protocol_fee_bips && *options.protocol_fee_bips != input.state.protocol_fee_bips )
    return std::unexpected( stf_errc::protocol_fee_mismatch );

  return {};
}

result< void > check_sequence( const transition_input& input )
{
  auto next = input.state.tx_id;
  for( const auto& tx: input.transactions )
  {
    if( tx.sequence != next )
      return std::unexpected( stf_errc::sequence_order_violation );

    auto following = numeric::increment( next );
    if( !following )
      return std::unexpected( following.error() );

    next = *following;
  }

  return {};
}

} // namespace

result< transition_output >
apply( const transition_input& input, const verifier::verifier& v, const apply_options& options )
{
  if( input.version != transition_input_version )
    return std::unexpected( stf_errc::unsupported_version );

  if( auto checked = check_prior( input, v, options ); !checked )
    return std::unexpected( checked.error() );

  if( auto checked = check_parameters( input, options ); !checked )
    return std::unexpected( checked.error() );

  if( input.state.root( input.accounts_root, input.requests_root ) != input.root )
    return std::unexpected( stf_errc::state_root_mismatch );

  sparse_state scratch = input.state;

  if( auto verified = scratch.accounts.verify( input.accounts_root, std::span( input.account_proofs ) ); !verified )
    return std::unexpected( verified.error() );

  if( auto verified = scratch.requests.verify( input.requests_root, std::span( input.request_proofs ) ); !verified )
    return std::unexpected( verified.error() );

  if( auto checked = check_sequence( input ); !checked )
    return std::unexpected( checked.error() );

  LOG_INFO( log::instance(),
            "Applying {} transactions from {}",
            input.transactions.size(),
            log::hex_of( input.root ) );

  transition_output output;

  for( const auto& tx: input.transactions )
  {
    auto receipt = execute( scratch, tx.tx, v );
    if( !receipt )
    {
      LOG_INFO( log::instance(), "Batch rejected at sequence {}: {}", tx.sequence, receipt.error().message() );
      return std::unexpected( receipt.error() );
    }

    if( *receipt )
      output.public_values.receipts.push_back( std::move( **receipt ) );
  }

  auto accounts_root = state::compute_root( input.accounts_root, std::span( input.account_proofs ), scratch.accounts.values() );
  if( !accounts_root )
    return std::unexpected( accounts_root.error() );

  auto requests_root = state::compute_root( input.requests_root, std::span( input.request_proofs ), scratch.requests.values() );
  if( !requests_root )
    return std::unexpected( requests_root.error() );

  output.new_accounts_root = *accounts_root;
  output.new_requests_root = *requests_root;
  output.new_root          = scratch.root( *accounts_root, *requests_root );

  output.public_values.old_root      = input.root;
  output.public_values.new_root      = output.new_root;
  output.public_values.accounts_root = output.new_accounts_root;
  output.public_values.requests_root = output.new_requests_root;
  output.public_values.timestamp     = input.timestamp;

  output.encoded_public_values = protocol::to_binary( output.public_values );

  LOG_INFO( log::instance(),
            "Batch applied - Transactions: {}, Receipts: {}, Root: {}",
            input.transactions.size(),
            output.public_values.receipts.size(),
            log::hex_of( output.new_root ) );

  return output;
}

} // namespace vapp::stf
