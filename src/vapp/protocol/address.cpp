#include <vapp/protocol/address.hpp>

#include <algorithm>

namespace vapp::protocol {

bool address::is_zero() const noexcept
{
  return *this == address{};
}

std::vector< std::byte > address::raw() const
{
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

std::vector< std::byte > request_id::raw() const
{
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

std::optional< address > make_address( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != address_length )
    return std::nullopt;

  address a;
  std::ranges::copy( bytes, a.bytes.begin() );
  return a;
}

std::optional< request_id > make_request_id( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != request_id_length )
    return std::nullopt;

  request_id id;
  std::ranges::copy( bytes, id.bytes.begin() );
  return id;
}

request_id to_request_id( const crypto::digest& d ) noexcept
{
  request_id id;
  std::ranges::copy( d, id.bytes.begin() );
  return id;
}

address address_of( const crypto::public_key& key ) noexcept
{
  auto digest = crypto::hash( key.bytes() );

  address a;
  std::ranges::copy( std::span( digest ).last( address_length ), a.bytes.begin() );
  return a;
}

} // namespace vapp::protocol

namespace vapp::state {

merkle_index key_traits< protocol::address >::index( const protocol::address& key )
{
  return numeric::from_bytes( key.bytes );
}

merkle_index key_traits< protocol::request_id >::index( const protocol::request_id& key )
{
  return numeric::from_bytes( std::span( key.bytes ).first( 16 ) );
}

} // namespace vapp::state
