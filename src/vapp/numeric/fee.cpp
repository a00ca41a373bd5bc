#include <vapp/numeric/fee.hpp>

namespace vapp::numeric {

static result< uint256 > share( const uint256& amount, const uint256& bips )
{
  return mul( amount, bips ).and_then(
    []( auto&& product )
    {
      return div( product, uint256( basis_points_denominator ) );
    } );
}

result< fee_split > fee( const uint256& amount, const uint256& protocol_fee_bips, const uint256& staker_fee_bips )
{
  auto total_bips = add( protocol_fee_bips, staker_fee_bips );
  if( !total_bips )
    return std::unexpected( total_bips.error() );

  if( *total_bips > basis_points_denominator )
    return std::unexpected( numeric_errc::overflow );

  auto protocol_reward = share( amount, protocol_fee_bips );
  if( !protocol_reward )
    return std::unexpected( protocol_reward.error() );

  auto staker_reward = share( amount, staker_fee_bips );
  if( !staker_reward )
    return std::unexpected( staker_reward.error() );

  auto owner_reward = sub( amount, *protocol_reward ).and_then(
    [ & ]( auto&& remainder )
    {
      return sub( remainder, *staker_reward );
    } );

  if( !owner_reward )
    return std::unexpected( owner_reward.error() );

  return fee_split{ .protocol_reward = *protocol_reward,
                    .staker_reward   = *staker_reward,
                    .owner_reward    = *owner_reward };
}

} // namespace vapp::numeric
