#include <vapp/stf/execute.hpp>

#include <algorithm>
#include <variant>

#include <vapp/log.hpp>
#include <vapp/numeric.hpp>
#include <vapp/protocol/account.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/protocol/message.hpp>

namespace vapp::stf {

namespace {

result< protocol::address > parse_address( const protocol::raw_bytes& bytes )
{
  auto a = protocol::make_address( bytes );
  if( !a )
    return std::unexpected( stf_errc::address_deserialization_failed );

  return *a;
}

result< crypto::digest > parse_digest( const protocol::raw_bytes& bytes )
{
  if( bytes.size() != crypto::digest_length )
    return std::unexpected( stf_errc::malformed_public_values_hash );

  crypto::digest d{};
  std::ranges::copy( bytes, d.begin() );
  return d;
}

template< typename Body >
result< protocol::address > verify_signature( const protocol::signed_message< Body >& message )
{
  auto signer = message.verify();
  if( !signer )
    return std::unexpected( stf_errc::invalid_signature );

  return *signer;
}

bool matches( const protocol::raw_bytes& bytes, const crypto::digest& d )
{
  return std::ranges::equal( bytes, d );
}

template< typename A, typename R >
class executor final
{
public:
  using state_type = state::vapp_state< A, R >;

  executor( state_type& s, const verifier::verifier& v ) noexcept:
      _state( s ),
      _verifier( v )
  {}

  result< std::optional< protocol::receipt > >
  operator()( const protocol::onchain_transaction< protocol::deposit >& tx )
  {
    LOG_INFO( log::instance(),
              "TX {}: DEPOSIT - Account: {}, Amount: {}",
              _state.tx_id,
              log::hex_of( tx.action.account.bytes ),
              log::amount{ tx.action.amount } );

    if( auto valid = advance_onchain( tx ); !valid )
      return std::unexpected( valid.error() );

    if( auto credited = credit( tx.action.account, tx.action.amount ); !credited )
      return std::unexpected( credited.error() );

    return protocol::receipt( protocol::onchain_receipt< protocol::deposit >{
      .onchain_tx_id = tx.onchain_tx,
      .status        = protocol::transaction_status::completed,
      .action        = tx.action } );
  }

  result< std::optional< protocol::receipt > >
  operator()( const protocol::onchain_transaction< protocol::create_prover >& tx )
  {
    LOG_INFO( log::instance(),
              "TX {}: CREATE_PROVER - Prover: {}, Owner: {}",
              _state.tx_id,
              log::hex_of( tx.action.prover.bytes ),
              log::hex_of( tx.action.owner.bytes ) );

    if( auto valid = advance_onchain( tx ); !valid )
      return std::unexpected( valid.error() );

    // The owner signs for the prover until a delegate is set
    auto prover = _state.accounts.entry( tx.action.prover );
    if( !prover )
      return std::unexpected( prover.error() );

    ( *prover )->owner            = tx.action.owner;
    ( *prover )->delegated_signer = tx.action.owner;
    ( *prover )->staker_fee_bips  = tx.action.staker_fee_bips;

    return protocol::receipt( protocol::onchain_receipt< protocol::create_prover >{
      .onchain_tx_id = tx.onchain_tx,
      .status        = protocol::transaction_status::completed,
      .action        = tx.action } );
  }

  result< std::optional< protocol::receipt > > operator()( const protocol::delegate_transaction& tx )
  {
    const auto& body = tx.delegation.body;

    LOG_INFO( log::instance(), "TX {}: DELEGATE", _state.tx_id );

    auto owner = verify_signature( tx.delegation );
    if( !owner )
      return std::unexpected( owner.error() );

    if( auto valid = check_domain( body.domain ); !valid )
      return std::unexpected( valid.error() );

    if( auto processed = mark_processed( protocol::hash_with_signer( body, *owner ) ); !processed )
      return std::unexpected( processed.error() );

    auto prover_address = parse_address( body.prover );
    if( !prover_address )
      return std::unexpected( prover_address.error() );

    auto auctioneer = parse_address( body.auctioneer );
    if( !auctioneer )
      return std::unexpected( auctioneer.error() );

    auto prover = _state.accounts.get( *prover_address );
    if( !prover )
      return std::unexpected( prover.error() );

    if( !prover->has_value() )
      return std::unexpected( stf_errc::prover_does_not_exist );

    if( ( *prover )->owner != *owner )
      return std::unexpected( stf_errc::only_owner_can_delegate );

    if( auto paid = pay( *owner, *auctioneer, body.fee ); !paid )
      return std::unexpected( paid.error() );

    auto delegate = parse_address( body.delegate );
    if( !delegate )
      return std::unexpected( delegate.error() );

    auto slot = _state.accounts.entry( *prover_address );
    if( !slot )
      return std::unexpected( slot.error() );

    ( *slot )->delegated_signer = *delegate;

    LOG_DEBUG( log::instance(),
               "Prover {} delegated to {}",
               log::hex_of( prover_address->bytes ),
               log::hex_of( delegate->bytes ) );

    return std::nullopt;
  }

  result< std::optional< protocol::receipt > > operator()( const protocol::transfer_transaction& tx )
  {
    const auto& body = tx.transfer.body;

    LOG_INFO( log::instance(), "TX {}: TRANSFER - Amount: {}", _state.tx_id, log::amount{ body.amount } );

    auto from = verify_signature( tx.transfer );
    if( !from )
      return std::unexpected( from.error() );

    if( auto valid = check_domain( body.domain ); !valid )
      return std::unexpected( valid.error() );

    if( auto processed = mark_processed( protocol::hash_with_signer( body, *from ) ); !processed )
      return std::unexpected( processed.error() );

    auto to = parse_address( body.to );
    if( !to )
      return std::unexpected( to.error() );

    auto auctioneer = parse_address( body.auctioneer );
    if( !auctioneer )
      return std::unexpected( auctioneer.error() );

    auto total = numeric::add( body.amount, body.fee );
    if( !total )
      return std::unexpected( total.error() );

    if( auto covered = require_balance( *from, *total ); !covered )
      return std::unexpected( covered.error() );

    if( auto paid = pay( *from, *to, body.amount ); !paid )
      return std::unexpected( paid.error() );

    if( auto paid = pay( *from, *auctioneer, body.fee ); !paid )
      return std::unexpected( paid.error() );

    return std::nullopt;
  }

  result< std::optional< protocol::receipt > > operator()( const protocol::withdraw_transaction& tx )
  {
    const auto& body = tx.withdrawal.body;

    LOG_INFO( log::instance(), "TX {}: WITHDRAW - Amount: {}", _state.tx_id, log::amount{ body.amount } );

    auto from = verify_signature( tx.withdrawal );
    if( !from )
      return std::unexpected( from.error() );

    if( auto valid = check_domain( body.domain ); !valid )
      return std::unexpected( valid.error() );

    if( auto processed = mark_processed( protocol::hash_with_signer( body, *from ) ); !processed )
      return std::unexpected( processed.error() );

    auto account_address = parse_address( body.account );
    if( !account_address )
      return std::unexpected( account_address.error() );

    auto account = load( *account_address );
    if( !account )
      return std::unexpected( account.error() );

    // Accounts without an owner are not provers and only withdraw for themselves
    if( account->owner.is_zero() && *account_address != *from )
      return std::unexpected( stf_errc::only_account_can_withdraw );

    auto auctioneer = parse_address( body.auctioneer );
    if( !auctioneer )
      return std::unexpected( auctioneer.error() );

    if( *account_address == *from )
    {
      auto total = numeric::add( body.amount, body.fee );
      if( !total )
        return std::unexpected( total.error() );

      if( auto covered = require_balance( *account_address, *total ); !covered )
        return std::unexpected( covered.error() );

      if( auto debited = debit( *account_address, body.amount ); !debited )
        return std::unexpected( debited.error() );
    }
    else
    {
      // The prover pays the amount, the signer pays the fee
      if( auto covered = require_balance( *account_address, body.amount ); !covered )
        return std::unexpected( covered.error() );

      if( auto covered = require_balance( *from, body.fee ); !covered )
        return std::unexpected( covered.error() );

      if( auto debited = debit( *account_address, body.amount ); !debited )
        return std::unexpected( debited.error() );
    }

    if( auto paid = pay( *from, *auctioneer, body.fee ); !paid )
      return std::unexpected( paid.error() );

    return protocol::receipt( protocol::offchain_receipt< protocol::withdraw >{
      .status = protocol::transaction_status::completed,
      .action = protocol::withdraw{ .account = *account_address, .amount = body.amount } } );
  }

  result< std::optional< protocol::receipt > > operator()( const protocol::clear_transaction& tx )
  {
    const auto& request = tx.request.body;
    const auto& bid     = tx.bid.body;
    const auto& settle  = tx.settle.body;
    const auto& execute = tx.execute.body;

    auto requester = verify_signature( tx.request );
    if( !requester )
      return std::unexpected( requester.error() );

    auto bidder = verify_signature( tx.bid );
    if( !bidder )
      return std::unexpected( bidder.error() );

    auto settler = verify_signature( tx.settle );
    if( !settler )
      return std::unexpected( settler.error() );

    auto executor_address = verify_signature( tx.execute );
    if( !executor_address )
      return std::unexpected( executor_address.error() );

    for( const auto& domain: { request.domain, bid.domain, settle.domain, execute.domain } )
    {
      if( auto valid = check_domain( domain ); !valid )
        return std::unexpected( valid.error() );
    }

    auto id = protocol::hash_with_signer( request, *requester );
    if( !matches( bid.request_id, id ) || !matches( settle.request_id, id ) || !matches( execute.request_id, id ) )
      return std::unexpected( stf_errc::request_id_mismatch );

    LOG_INFO( log::instance(), "TX {}: CLEAR - Request: {}", _state.tx_id, log::hex_of( id ) );

    // A request pays out at most once
    if( auto processed = mark_processed( id ); !processed )
      return std::unexpected( processed.error() );

    auto prover_address = parse_address( bid.prover );
    if( !prover_address )
      return std::unexpected( prover_address.error() );

    auto prover = load( *prover_address );
    if( !prover )
      return std::unexpected( prover.error() );

    if( prover->delegated_signer != *bidder )
      return std::unexpected( stf_errc::prover_delegated_signer_mismatch );

    if( !request.whitelist.empty() && std::ranges::find( request.whitelist, prover_address->raw() ) == request.whitelist.end() )
      return std::unexpected( stf_errc::prover_not_in_whitelist );

    auto auctioneer = parse_address( request.auctioneer );
    if( !auctioneer )
      return std::unexpected( auctioneer.error() );

    if( *auctioneer != *settler )
      return std::unexpected( stf_errc::auctioneer_mismatch );

    auto request_executor = parse_address( request.executor );
    if( !request_executor )
      return std::unexpected( request_executor.error() );

    if( *request_executor != *executor_address )
      return std::unexpected( stf_errc::executor_mismatch );

    if( bid.amount > request.max_price_per_pgu )
      return std::unexpected( stf_errc::max_price_per_pgu_exceeded );

    if( execute.status == protocol::execution_status::unexecutable )
      return punish( tx, *requester );

    if( execute.status != protocol::execution_status::executed )
      return std::unexpected( stf_errc::execution_failed );

    if( auto verified = verify_fulfillment( tx, id ); !verified )
      return std::unexpected( verified.error() );

    if( !execute.pgus )
      return std::unexpected( stf_errc::missing_pgus_used );

    if( *execute.pgus > request.gas_limit )
      return std::unexpected( stf_errc::gas_limit_exceeded );

    auto cost = numeric::mul( bid.amount, *execute.pgus ).and_then(
      [ & ]( auto&& usage )
      {
        return numeric::add( usage, request.base_fee );
      } );

    if( !cost )
      return std::unexpected( cost.error() );

    auto requester_account = _state.accounts.get( *requester );
    if( !requester_account )
      return std::unexpected( requester_account.error() );

    if( !requester_account->has_value() )
      return std::unexpected( stf_errc::account_does_not_exist );

    if( ( *requester_account )->balance < *cost )
      return std::unexpected( stf_errc::insufficient_balance );

    LOG_INFO( log::instance(),
              "Requester fee = {} PGUs x {} per PGU + {} = {}",
              *execute.pgus,
              log::amount{ bid.amount },
              log::amount{ request.base_fee },
              log::amount{ *cost } );

    if( auto debited = debit( *requester, *cost ); !debited )
      return std::unexpected( debited.error() );

    auto treasury = parse_address( request.treasury );
    if( !treasury )
      return std::unexpected( treasury.error() );

    auto split = numeric::fee( *cost, _state.protocol_fee_bips, prover->staker_fee_bips );
    if( !split )
      return std::unexpected( split.error() );

    if( auto credited = credit( *treasury, split->protocol_reward ); !credited )
      return std::unexpected( credited.error() );

    if( auto credited = credit( *prover_address, split->staker_reward ); !credited )
      return std::unexpected( credited.error() );

    if( auto credited = credit( prover->owner, split->owner_reward ); !credited )
      return std::unexpected( credited.error() );

    return std::nullopt;
  }

private:
  template< typename Action >
  result< void > advance_onchain( const protocol::onchain_transaction< Action >& tx )
  {
    if( tx.onchain_tx != _state.onchain_tx_id )
      return std::unexpected( stf_errc::onchain_tx_out_of_order );

    if( tx.block < _state.onchain_block )
      return std::unexpected( stf_errc::block_number_out_of_order );

    if( tx.block == _state.onchain_block && tx.log_index <= _state.onchain_log_index )
      return std::unexpected( stf_errc::log_index_out_of_order );

    auto next = numeric::increment( _state.onchain_tx_id );
    if( !next )
      return std::unexpected( next.error() );

    _state.onchain_tx_id     = *next;
    _state.onchain_block     = tx.block;
    _state.onchain_log_index = tx.log_index;

    return {};
  }

  result< void > check_domain( const crypto::digest& domain ) const
  {
    if( domain != _state.domain )
      return std::unexpected( stf_errc::domain_mismatch );

    return {};
  }

  result< void > mark_processed( const crypto::digest& id )
  {
    auto key       = protocol::to_request_id( id );
    auto processed = _state.requests.get( key );
    if( !processed )
      return std::unexpected( processed.error() );

    if( processed->value_or( false ) )
    {
      LOG_DEBUG( log::instance(), "Transaction {} already processed", log::hex_of( id ) );
      return std::unexpected( stf_errc::status_monotonicity_violation );
    }

    return _state.requests.insert( key, true );
  }

  result< protocol::account > load( const protocol::address& a ) const
  {
    auto value = _state.accounts.get( a );
    if( !value )
      return std::unexpected( value.error() );

    return value->value_or( protocol::account{} );
  }

  result< void > require_balance( const protocol::address& a, const numeric::uint256& amount ) const
  {
    auto account = load( a );
    if( !account )
      return std::unexpected( account.error() );

    if( account->balance < amount )
      return std::unexpected( stf_errc::insufficient_balance );

    return {};
  }

  result< void > credit( const protocol::address& a, const numeric::uint256& amount )
  {
    LOG_DEBUG( log::instance(), "Account {}: + {}", log::hex_of( a.bytes ), log::amount{ amount } );

    auto slot = _state.accounts.entry( a );
    if( !slot )
      return std::unexpected( slot.error() );

    return ( *slot )->add_balance( amount );
  }

  result< void > debit( const protocol::address& a, const numeric::uint256& amount )
  {
    LOG_DEBUG( log::instance(), "Account {}: - {}", log::hex_of( a.bytes ), log::amount{ amount } );

    auto slot = _state.accounts.entry( a );
    if( !slot )
      return std::unexpected( slot.error() );

    if( ( *slot )->balance < amount )
      return std::unexpected( stf_errc::insufficient_balance );

    return ( *slot )->deduct_balance( amount );
  }

  result< void > pay( const protocol::address& from, const protocol::address& to, const numeric::uint256& amount )
  {
    if( auto debited = debit( from, amount ); !debited )
      return debited;

    return credit( to, amount );
  }

  result< std::optional< protocol::receipt > > punish( const protocol::clear_transaction& tx,
                                                       const protocol::address& requester )
  {
    const auto& request = tx.request.body;
    const auto& execute = tx.execute.body;

    if( !execute.punishment )
      return std::unexpected( stf_errc::missing_punishment );

    auto max_cost = numeric::mul( request.max_price_per_pgu, request.gas_limit ).and_then(
      [ & ]( auto&& limit )
      {
        return numeric::add( limit, request.base_fee );
      } );

    if( !max_cost )
      return std::unexpected( max_cost.error() );

    if( *execute.punishment > *max_cost )
      return std::unexpected( stf_errc::punishment_exceeds_max_cost );

    auto treasury = parse_address( request.treasury );
    if( !treasury )
      return std::unexpected( treasury.error() );

    LOG_INFO( log::instance(),
              "Request unexecutable, punishing requester {} by {}",
              log::hex_of( requester.bytes ),
              log::amount{ *execute.punishment } );

    if( auto paid = pay( requester, *treasury, *execute.punishment ); !paid )
      return std::unexpected( paid.error() );

    return std::nullopt;
  }

  result< void > verify_fulfillment( const protocol::clear_transaction& tx, const crypto::digest& id ) const
  {
    const auto& request = tx.request.body;
    const auto& execute = tx.execute.body;

    if( !tx.fulfill )
      return std::unexpected( stf_errc::missing_fulfill );

    auto fulfiller = verify_signature( *tx.fulfill );
    if( !fulfiller )
      return std::unexpected( fulfiller.error() );

    if( auto valid = check_domain( tx.fulfill->body.domain ); !valid )
      return valid;

    if( !matches( tx.fulfill->body.request_id, id ) )
      return std::unexpected( stf_errc::request_id_mismatch );

    if( !execute.public_values_hash )
      return std::unexpected( stf_errc::missing_public_values_hash );

    auto public_values_hash = parse_digest( *execute.public_values_hash );
    if( !public_values_hash )
      return std::unexpected( public_values_hash.error() );

    if( request.public_values_hash )
    {
      auto expected_hash = parse_digest( *request.public_values_hash );
      if( !expected_hash )
        return std::unexpected( expected_hash.error() );

      if( *expected_hash != *public_values_hash )
        return std::unexpected( stf_errc::public_values_hash_mismatch );
    }

    switch( request.mode )
    {
      case protocol::proof_mode::compressed:
        if( !_verifier.verify( verifier::to_vk_digest( request.vk_hash ), *public_values_hash ) )
          return std::unexpected( stf_errc::invalid_proof );
        break;
      case protocol::proof_mode::groth16:
      case protocol::proof_mode::plonk:
        {
          if( !tx.verify )
            return std::unexpected( stf_errc::missing_verifier_signature );

          auto attested_by = tx.verify->verify( protocol::hash_with_signer( tx.fulfill->body, *fulfiller ) );
          if( !attested_by )
            return std::unexpected( stf_errc::invalid_verifier_signature );

          auto request_verifier = parse_address( request.verifier );
          if( !request_verifier )
            return std::unexpected( request_verifier.error() );

          if( *attested_by != *request_verifier )
            return std::unexpected( stf_errc::invalid_verifier_signature );
        }
        break;
      default:
        return std::unexpected( stf_errc::unsupported_proof_mode );
    }

    return {};
  }

  state_type& _state;
  const verifier::verifier& _verifier;
};

} // namespace

template< typename A, typename R >
result< std::optional< protocol::receipt > >
execute( state::vapp_state< A, R >& state, const protocol::transaction& tx, const verifier::verifier& v )
{
  auto next = numeric::increment( state.tx_id );
  if( !next )
    return std::unexpected( next.error() );

  executor< A, R > exec( state, v );

  auto receipt = std::visit( exec, tx );
  if( !receipt )
  {
    LOG_DEBUG( log::instance(), "TX {} failed: {}", state.tx_id, receipt.error().message() );
    return receipt;
  }

  state.tx_id = *next;
  return receipt;
}

template result< std::optional< protocol::receipt > >
execute( full_state& state, const protocol::transaction& tx, const verifier::verifier& v );

template result< std::optional< protocol::receipt > >
execute( sparse_state& state, const protocol::transaction& tx, const verifier::verifier& v );

} // namespace vapp::stf
