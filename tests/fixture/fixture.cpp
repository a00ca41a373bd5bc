// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>
#include <cstring>
#include <span>

#include <vapp/log.hpp>

namespace test {

constexpr std::uint64_t protocol_fee_bips = 100;

std::vector< std::byte > public_values_claiming( std::uint64_t receipts )
{
  vapp::stf::step_public_values one;
  one.receipts.push_back( vapp::protocol::onchain_receipt< vapp::protocol::deposit >{} );

  auto encoded   = vapp::protocol::to_binary( vapp::stf::step_public_values{} );
  auto reference = vapp::protocol::to_binary( one );

  // The first byte that differs starts the little-endian receipt count
  auto offset = std::ranges::mismatch( encoded, reference ).in1 - encoded.begin();
  std::memcpy( encoded.data() + offset, &receipts, sizeof( receipts ) );
  return encoded;
}

fixture::fixture( const std::string& name, const std::string& log_level ):
    _domain( vapp::crypto::hash( name ) ),
    _vk( vapp::verifier::to_vk_digest( vapp::crypto::hash( "vapp program" ) ) ),
    _auctioneer_key( vapp::crypto::secret_key::create( vapp::crypto::hash( "auctioneer" ) ) ),
    _executor_key( vapp::crypto::secret_key::create( vapp::crypto::hash( "executor" ) ) ),
    _verifier_key( vapp::crypto::secret_key::create( vapp::crypto::hash( "verifier" ) ) ),
    _treasury( address_of( vapp::crypto::secret_key::create( vapp::crypto::hash( "treasury" ) ) ) ),
    _state( _domain, protocol_fee_bips )
{
  vapp::log::initialize( vapp::log::level_from_string( log_level ).value_or( quill::LogLevel::Info ) );
  LOG_INFO( vapp::log::instance(), "Using domain: {}", vapp::log::hex_of( _domain ) );
}

vapp::protocol::address fixture::address_of( const vapp::crypto::secret_key& key )
{
  return vapp::protocol::address_of( key.public_key() );
}

std::uint64_t fixture::next_nonce() noexcept
{
  return _nonce++;
}

vapp::protocol::transaction fixture::make_deposit( const vapp::protocol::address& account,
                                                   const vapp::numeric::uint256& amount )
{
  vapp::protocol::onchain_transaction< vapp::protocol::deposit > tx;
  tx.tx_hash    = vapp::crypto::hash( _onchain_tx );
  tx.block      = _block;
  tx.log_index  = ++_log_index;
  tx.onchain_tx = _onchain_tx++;
  tx.action     = vapp::protocol::deposit{ .account = account, .amount = amount };
  return tx;
}

vapp::protocol::transaction fixture::make_create_prover( const vapp::protocol::address& prover,
                                                         const vapp::protocol::address& owner,
                                                         const vapp::numeric::uint256& staker_fee_bips )
{
  vapp::protocol::onchain_transaction< vapp::protocol::create_prover > tx;
  tx.tx_hash    = vapp::crypto::hash( _onchain_tx );
  tx.block      = _block;
  tx.log_index  = ++_log_index;
  tx.onchain_tx = _onchain_tx++;
  tx.action = vapp::protocol::create_prover{ .prover = prover, .owner = owner, .staker_fee_bips = staker_fee_bips };
  return tx;
}

vapp::protocol::transaction fixture::make_transfer( const vapp::crypto::secret_key& from,
                                                    const vapp::protocol::address& to,
                                                    const vapp::numeric::uint256& amount,
                                                    const vapp::numeric::uint256& fee )
{
  vapp::protocol::transfer_body body;
  body.domain     = _domain;
  body.nonce      = next_nonce();
  body.to         = to.raw();
  body.amount     = amount;
  body.fee        = fee;
  body.auctioneer = address_of( _auctioneer_key ).raw();
  return vapp::protocol::transfer_transaction{ .transfer = vapp::protocol::sign( from, std::move( body ) ) };
}

vapp::protocol::transaction fixture::make_withdraw( const vapp::crypto::secret_key& signer,
                                                    const vapp::protocol::address& account,
                                                    const vapp::numeric::uint256& amount,
                                                    const vapp::numeric::uint256& fee )
{
  vapp::protocol::withdraw_body body;
  body.domain     = _domain;
  body.nonce      = next_nonce();
  body.account    = account.raw();
  body.amount     = amount;
  body.fee        = fee;
  body.auctioneer = address_of( _auctioneer_key ).raw();
  return vapp::protocol::withdraw_transaction{ .withdrawal = vapp::protocol::sign( signer, std::move( body ) ) };
}

vapp::protocol::transaction fixture::make_delegate( const vapp::crypto::secret_key& owner,
                                                    const vapp::protocol::address& prover,
                                                    const vapp::protocol::address& delegate,
                                                    const vapp::numeric::uint256& fee )
{
  vapp::protocol::delegate_body body;
  body.domain     = _domain;
  body.nonce      = next_nonce();
  body.prover     = prover.raw();
  body.delegate   = delegate.raw();
  body.fee        = fee;
  body.auctioneer = address_of( _auctioneer_key ).raw();
  return vapp::protocol::delegate_transaction{ .delegation = vapp::protocol::sign( owner, std::move( body ) ) };
}

static std::vector< std::byte > to_raw( const vapp::crypto::digest& d )
{
  return std::vector< std::byte >( d.begin(), d.end() );
}

vapp::protocol::transaction fixture::make_clear( const vapp::crypto::secret_key& requester,
                                                 const vapp::crypto::secret_key& bidder,
                                                 const vapp::protocol::address& prover,
                                                 const vapp::numeric::uint256& price,
                                                 const clear_options& options )
{
  vapp::protocol::request_body request;
  request.domain            = _domain;
  request.nonce             = next_nonce();
  request.vk_hash           = vapp::verifier::from_vk_digest( _vk );
  request.mode              = options.mode;
  request.gas_limit         = options.gas_limit;
  request.base_fee          = options.base_fee;
  request.max_price_per_pgu = options.max_price_per_pgu;
  request.auctioneer        = address_of( _auctioneer_key ).raw();
  request.executor          = address_of( _executor_key ).raw();
  request.verifier          = address_of( _verifier_key ).raw();
  request.treasury          = _treasury.raw();

  for( const auto& allowed: options.whitelist )
    request.whitelist.push_back( allowed.raw() );

  if( options.request_public_values_hash )
    request.public_values_hash = to_raw( *options.request_public_values_hash );

  vapp::protocol::clear_transaction clear;
  clear.request = vapp::protocol::sign( requester, std::move( request ) );

  auto id = to_raw( vapp::protocol::hash_with_signer( clear.request.body, address_of( requester ) ) );

  vapp::protocol::bid_body bid;
  bid.domain     = _domain;
  bid.nonce      = next_nonce();
  bid.request_id = id;
  bid.prover     = prover.raw();
  bid.amount     = price;
  clear.bid      = vapp::protocol::sign( bidder, std::move( bid ) );

  vapp::protocol::settle_body settle;
  settle.domain     = _domain;
  settle.nonce      = next_nonce();
  settle.request_id = id;
  clear.settle      = vapp::protocol::sign( options.settler.value_or( _auctioneer_key ), std::move( settle ) );

  vapp::protocol::execute_body execute;
  execute.domain     = _domain;
  execute.nonce      = next_nonce();
  execute.request_id = id;
  execute.status     = options.status;
  execute.pgus       = options.pgus;
  execute.punishment = options.punishment;

  if( options.public_values_hash )
    execute.public_values_hash = to_raw( *options.public_values_hash );

  clear.execute = vapp::protocol::sign( options.executor.value_or( _executor_key ), std::move( execute ) );

  if( options.with_fulfill )
  {
    vapp::protocol::fulfill_body fulfill;
    fulfill.domain     = _domain;
    fulfill.nonce      = next_nonce();
    fulfill.request_id = id;
    fulfill.proof      = to_raw( vapp::crypto::hash( "proof" ) );
    clear.fulfill      = vapp::protocol::sign( bidder, std::move( fulfill ) );

    if( options.mode == vapp::protocol::proof_mode::groth16 || options.mode == vapp::protocol::proof_mode::plonk )
    {
      auto fulfillment_id = vapp::protocol::hash_with_signer( clear.fulfill->body, address_of( bidder ) );
      clear.verify        = vapp::protocol::attest( options.attester.value_or( _verifier_key ), fulfillment_id );
    }
  }

  return clear;
}

vapp::numeric::uint256 fixture::balance( const vapp::protocol::address& account ) const
{
  auto value = _state.accounts.values().find( vapp::state::key_index( account ) );
  if( value == _state.accounts.values().end() )
    return 0;

  return value->second.balance;
}

std::optional< vapp::stf::prior_step > fixture::prior() const
{
  if( _steps.empty() )
    return std::nullopt;

  return vapp::stf::prior_step{ .vk = _vk, .public_values = _steps.back() };
}

vapp::stf::result< vapp::stf::transition_input >
fixture::make_input( const std::vector< vapp::protocol::transaction >& transactions ) const
{
  return vapp::stf::make_input( _state, std::span( transactions ), _timestamp, _verifier, prior() );
}

vapp::stf::result< vapp::stf::transition_output >
fixture::apply( const std::vector< vapp::protocol::transaction >& transactions )
{
  auto input = make_input( transactions );
  if( !input )
  {
    LOG_ERROR( vapp::log::instance(), "Failed to build input: {}", input.error().message() );
    return std::unexpected( input.error() );
  }

  auto output = vapp::stf::apply( *input, _verifier );
  if( !output )
  {
    LOG_ERROR( vapp::log::instance(), "Failed to apply input: {}", output.error().message() );
    return output;
  }

  for( const auto& tx: transactions )
  {
    auto receipt = vapp::stf::execute( _state, tx, _verifier );
    if( !receipt )
      return std::unexpected( receipt.error() );
  }

  _steps.push_back( output->encoded_public_values );
  _timestamp++;

  return output;
}

} // namespace test

// NOLINTEND
