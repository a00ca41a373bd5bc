#pragma once

#include <cstdint>

#include <vapp/crypto/hash.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/state/merkle_storage.hpp>
#include <vapp/state/sparse_storage.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::state {

/*
 * Ledger state: scalar counters plus two merkleized storages, one keyed by account
 * address and one by request id.
 */
template< typename A, typename R >
struct vapp_state
{
  crypto::digest domain{};
  numeric::uint256 protocol_fee_bips;
  std::uint64_t tx_id             = 1;
  std::uint64_t onchain_tx_id     = 1;
  std::uint64_t onchain_block     = 0;
  std::uint64_t onchain_log_index = 0;
  A accounts;
  R requests;

  vapp_state() = default;

  explicit vapp_state( const crypto::digest& d, const numeric::uint256& fee_bips = 0 ):
      domain( d ),
      protocol_fee_bips( fee_bips )
  {}

  // Commits the counters together with the given storage roots.
  crypto::digest root( const crypto::digest& accounts_root, const crypto::digest& requests_root ) const
  {
    return crypto::hasher()
      .update( domain )
      .update( numeric::to_bytes( protocol_fee_bips ) )
      .update( tx_id )
      .update( onchain_tx_id )
      .update( onchain_block )
      .update( onchain_log_index )
      .update( accounts_root )
      .update( requests_root )
      .finalize();
  }

  crypto::digest root() const
    requires requires( const A& a, const R& r ) {
      a.root();
      r.root();
    }
  {
    return root( accounts.root(), requests.root() );
  }

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & protocol_fee_bips;
    ar & tx_id;
    ar & onchain_tx_id;
    ar & onchain_block;
    ar & onchain_log_index;
    ar & accounts;
    ar & requests;
  }
};

} // namespace vapp::state
