#pragma once

#include <cstddef>
#include <vector>

#include <vapp/numeric/checked.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::protocol {

/*
 * A requester or prover account. Provers additionally carry an owner, the signer
 * allowed to bid on their behalf, and the share of rewards paid to their stakers.
 */
struct account
{
  numeric::uint256 balance;
  address owner;
  address delegated_signer;
  numeric::uint256 staker_fee_bips;

  bool operator==( const account& ) const = default;

  bool is_prover() const noexcept;

  numeric::result< void > add_balance( const numeric::uint256& amount );
  numeric::result< void > deduct_balance( const numeric::uint256& amount );

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & balance;
    ar & owner;
    ar & delegated_signer;
    ar & staker_fee_bips;
  }
};

} // namespace vapp::protocol

namespace vapp::state {

template<>
struct leaf_codec< protocol::account >
{
  static std::vector< std::byte > encode( const protocol::account& a );
};

} // namespace vapp::state
