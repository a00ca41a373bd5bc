#pragma once

#include <vapp/numeric/checked.hpp>

namespace vapp::numeric {

constexpr std::uint64_t basis_points_denominator = 10'000;

struct fee_split
{
  uint256 protocol_reward;
  uint256 staker_reward;
  uint256 owner_reward;

  bool operator==( const fee_split& ) const = default;
};

/*
 * Splits a reward into protocol, staker and owner shares. The protocol and staker shares
 * truncate; the owner absorbs the remainder so the three always sum to amount. Fails with
 * numeric_errc::overflow when protocol_fee_bips + staker_fee_bips exceeds 10000.
 */
result< fee_split > fee( const uint256& amount, const uint256& protocol_fee_bips, const uint256& staker_fee_bips );

} // namespace vapp::numeric
