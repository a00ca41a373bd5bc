#include <vapp/protocol/message.hpp>

#include <span>
#include <type_traits>

namespace vapp::protocol {

namespace {

void update( crypto::hasher& h, const crypto::digest& d ) noexcept
{
  h.update( d );
}

void update( crypto::hasher& h, std::uint64_t value ) noexcept
{
  h.update( value );
}

void update( crypto::hasher& h, const numeric::uint256& value ) noexcept
{
  h.update( numeric::to_bytes( value ) );
}

void update( crypto::hasher& h, const raw_bytes& bytes ) noexcept
{
  h.update( static_cast< std::uint64_t >( bytes.size() ) ).update( std::span( bytes ) );
}

template< typename E >
  requires std::is_enum_v< E >
void update( crypto::hasher& h, E e ) noexcept
{
  h.update( static_cast< std::underlying_type_t< E > >( e ) );
}

void update( crypto::hasher& h, const std::vector< raw_bytes >& list ) noexcept
{
  h.update( static_cast< std::uint64_t >( list.size() ) );
  for( const auto& bytes: list )
    update( h, bytes );
}

template< typename T >
void update( crypto::hasher& h, const std::optional< T >& value ) noexcept
{
  h.update( static_cast< std::uint8_t >( value.has_value() ) );
  if( value )
    update( h, *value );
}

crypto::hasher begin( message_type type, const crypto::digest& domain, std::uint64_t nonce ) noexcept
{
  crypto::hasher h;
  update( h, type );
  update( h, domain );
  update( h, nonce );
  return h;
}

} // namespace

crypto::digest body_hash( const transfer_body& body ) noexcept
{
  auto h = begin( message_type::transfer, body.domain, body.nonce );
  update( h, body.to );
  update( h, body.amount );
  update( h, body.fee );
  update( h, body.auctioneer );
  return h.finalize();
}

crypto::digest body_hash( const withdraw_body& body ) noexcept
{
  auto h = begin( message_type::withdraw, body.domain, body.nonce );
  update( h, body.account );
  update( h, body.amount );
  update( h, body.fee );
  update( h, body.auctioneer );
  return h.finalize();
}

crypto::digest body_hash( const delegate_body& body ) noexcept
{
  auto h = begin( message_type::delegate, body.domain, body.nonce );
  update( h, body.prover );
  update( h, body.delegate );
  update( h, body.fee );
  update( h, body.auctioneer );
  return h.finalize();
}

crypto::digest body_hash( const request_body& body ) noexcept
{
  auto h = begin( message_type::request, body.domain, body.nonce );
  update( h, body.vk_hash );
  update( h, body.mode );
  update( h, body.gas_limit );
  update( h, body.base_fee );
  update( h, body.max_price_per_pgu );
  update( h, body.whitelist );
  update( h, body.auctioneer );
  update( h, body.executor );
  update( h, body.verifier );
  update( h, body.treasury );
  update( h, body.public_values_hash );
  return h.finalize();
}

crypto::digest body_hash( const bid_body& body ) noexcept
{
  auto h = begin( message_type::bid, body.domain, body.nonce );
  update( h, body.request_id );
  update( h, body.prover );
  update( h, body.amount );
  return h.finalize();
}

crypto::digest body_hash( const settle_body& body ) noexcept
{
  auto h = begin( message_type::settle, body.domain, body.nonce );
  update( h, body.request_id );
  return h.finalize();
}

crypto::digest body_hash( const execute_body& body ) noexcept
{
  auto h = begin( message_type::execute, body.domain, body.nonce );
  update( h, body.request_id );
  update( h, body.status );
  update( h, body.public_values_hash );
  update( h, body.pgus );
  update( h, body.punishment );
  return h.finalize();
}

crypto::digest body_hash( const fulfill_body& body ) noexcept
{
  auto h = begin( message_type::fulfill, body.domain, body.nonce );
  update( h, body.request_id );
  update( h, body.proof );
  return h.finalize();
}

crypto::digest hash_with_signer( const crypto::digest& body_digest, const address& signer ) noexcept
{
  return crypto::hasher().update( body_digest ).update( signer.bytes ).finalize();
}

std::optional< address > attestation::verify( const crypto::digest& d ) const
{
  if( !signer.verify( signature, d ) )
    return std::nullopt;

  return address_of( signer );
}

attestation attest( const crypto::secret_key& key, const crypto::digest& d )
{
  return attestation{ .signer = key.public_key(), .signature = key.sign( d ) };
}

} // namespace vapp::protocol
