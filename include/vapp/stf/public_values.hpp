#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <vapp/crypto/hash.hpp>
#include <vapp/protocol/receipt.hpp>
#include <vapp/protocol/serialization.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

/*
 * What a proven step commits to: the state root before and after the batch, the new
 * storage roots, the batch timestamp and the receipts for the settlement contract.
 */
struct step_public_values
{
  crypto::digest old_root{};
  crypto::digest new_root{};
  crypto::digest accounts_root{};
  crypto::digest requests_root{};
  std::uint64_t timestamp = 0;
  std::vector< protocol::receipt > receipts;

  bool operator==( const step_public_values& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & old_root;
    ar & new_root;
    ar & accounts_root;
    ar & requests_root;
    ar & timestamp;
    ar & receipts;
  }
};

// The digest a verifier checks for an encoded step_public_values.
verifier::pv_digest public_values_digest( std::span< const std::byte > encoded ) noexcept;

} // namespace vapp::stf
