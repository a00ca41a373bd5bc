#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <boost/serialization/version.hpp>

#include <vapp/crypto/hash.hpp>
#include <vapp/protocol/serialization.hpp>
#include <vapp/protocol/transaction.hpp>
#include <vapp/stf/public_values.hpp>
#include <vapp/stf/types.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

constexpr std::uint32_t transition_input_version = 1;

struct sequenced_transaction
{
  std::uint64_t sequence = 0;
  protocol::transaction tx;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & sequence;
    ar & tx;
  }
};

// The previous step's proof, identified by the program vk and its encoded public values.
struct prior_step
{
  verifier::vk_digest vk{};
  std::vector< std::byte > public_values;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & vk;
    ar & public_values;
  }
};

/*
 * Everything one proven step consumes. The state holds the leaves the batch touches,
 * the proofs authenticate them against accounts_root and requests_root, and root
 * commits to both together with the state counters.
 */
struct transition_input
{
  std::uint32_t version = transition_input_version;
  crypto::digest root{};
  crypto::digest accounts_root{};
  crypto::digest requests_root{};
  sparse_state state;
  std::vector< account_proof > account_proofs;
  std::vector< request_proof > request_proofs;
  std::vector< sequenced_transaction > transactions;
  std::uint64_t timestamp = 0;
  std::optional< prior_step > prior;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & this->version;
    ar & root;
    ar & accounts_root;
    ar & requests_root;
    ar & state;
    ar & account_proofs;
    ar & request_proofs;
    ar & transactions;
    ar & timestamp;
    ar & prior;
  }
};

struct transition_output
{
  crypto::digest new_accounts_root{};
  crypto::digest new_requests_root{};
  crypto::digest new_root{};
  step_public_values public_values;
  std::vector< std::byte > encoded_public_values;
};

} // namespace vapp::stf

BOOST_CLASS_VERSION( vapp::stf::transition_input, 1 )
