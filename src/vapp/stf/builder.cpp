#include <vapp/stf/builder.hpp>

#include <utility>
#include <vector>

#include <vapp/log.hpp>
#include <vapp/stf/execute.hpp>

namespace vapp::stf {

namespace {

template< typename Full, typename Sparse, typename Proof >
result< void > witness( const Full& original, const Full& touched_by, Sparse& storage, std::vector< Proof >& proofs )
{
  const auto& values = original.values();

  for( const auto& [ index, key ]: touched_by.touched() )
  {
    if( auto itr = values.find( index ); itr != values.end() )
    {
      if( auto inserted = storage.insert( key, itr->second ); !inserted )
        return std::unexpected( inserted.error() );
    }

    proofs.push_back( original.prove( key ) );
  }

  return {};
}

} // namespace

result< transition_input > make_input( const full_state& state,
                                       std::span< const protocol::transaction > transactions,
                                       std::uint64_t timestamp,
                                       const verifier::verifier& v,
                                       std::optional< prior_step > prior )
{
  full_state scratch = state;
  scratch.accounts.clear_touched();
  scratch.requests.clear_touched();

  transition_input input;
  input.timestamp = timestamp;
  input.prior     = std::move( prior );

  for( const auto& tx: transactions )
  {
    input.transactions.push_back( sequenced_transaction{ .sequence = scratch.tx_id, .tx = tx } );

    if( auto receipt = execute( scratch, tx, v ); !receipt )
      return std::unexpected( receipt.error() );
  }

  input.accounts_root = state.accounts.root();
  input.requests_root = state.requests.root();
  input.root          = state.root();

  input.state                   = sparse_state( state.domain, state.protocol_fee_bips );
  input.state.tx_id             = state.tx_id;
  input.state.onchain_tx_id     = state.onchain_tx_id;
  input.state.onchain_block     = state.onchain_block;
  input.state.onchain_log_index = state.onchain_log_index;

  if( auto witnessed = witness( state.accounts, scratch.accounts, input.state.accounts, input.account_proofs );
      !witnessed )
    return std::unexpected( witnessed.error() );

  if( auto witnessed = witness( state.requests, scratch.requests, input.state.requests, input.request_proofs );
      !witnessed )
    return std::unexpected( witnessed.error() );

  LOG_DEBUG( log::instance(),
             "Built input with {} transactions, {} account proofs and {} request proofs",
             input.transactions.size(),
             input.account_proofs.size(),
             input.request_proofs.size() );

  return input;
}

} // namespace vapp::stf
