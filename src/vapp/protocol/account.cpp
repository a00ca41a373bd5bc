#include <vapp/protocol/account.hpp>

namespace vapp::protocol {

bool account::is_prover() const noexcept
{
  return !owner.is_zero();
}

numeric::result< void > account::add_balance( const numeric::uint256& amount )
{
  auto sum = numeric::add( balance, amount );
  if( !sum )
    return std::unexpected( sum.error() );

  balance = *sum;
  return {};
}

numeric::result< void > account::deduct_balance( const numeric::uint256& amount )
{
  auto difference = numeric::sub( balance, amount );
  if( !difference )
    return std::unexpected( difference.error() );

  balance = *difference;
  return {};
}

} // namespace vapp::protocol

namespace vapp::state {

std::vector< std::byte > leaf_codec< protocol::account >::encode( const protocol::account& a )
{
  std::vector< std::byte > bytes;
  bytes.reserve( 2 * numeric::uint256_length + 2 * protocol::address_length );

  auto balance = numeric::to_bytes( a.balance );
  bytes.insert( bytes.end(), balance.begin(), balance.end() );
  bytes.insert( bytes.end(), a.owner.bytes.begin(), a.owner.bytes.end() );
  bytes.insert( bytes.end(), a.delegated_signer.bytes.begin(), a.delegated_signer.bytes.end() );

  auto staker_fee_bips = numeric::to_bytes( a.staker_fee_bips );
  bytes.insert( bytes.end(), staker_fee_bips.begin(), staker_fee_bips.end() );

  return bytes;
}

} // namespace vapp::state
