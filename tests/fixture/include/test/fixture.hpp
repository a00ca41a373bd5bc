#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <vapp/crypto.hpp>
#include <vapp/numeric.hpp>
#include <vapp/protocol.hpp>
#include <vapp/stf.hpp>
#include <vapp/verifier.hpp>

namespace test {

struct clear_options
{
  vapp::protocol::proof_mode mode          = vapp::protocol::proof_mode::compressed;
  vapp::protocol::execution_status status  = vapp::protocol::execution_status::executed;
  std::uint64_t gas_limit                  = 1'000;
  vapp::numeric::uint256 base_fee          = 0;
  vapp::numeric::uint256 max_price_per_pgu = 10;
  std::vector< vapp::protocol::address > whitelist;
  std::optional< vapp::crypto::digest > request_public_values_hash;
  std::optional< vapp::crypto::digest > public_values_hash = vapp::crypto::hash( "public values" );
  std::optional< vapp::numeric::uint256 > punishment;
  std::optional< std::uint64_t > pgus;
  bool with_fulfill = true;
  std::optional< vapp::crypto::secret_key > settler;
  std::optional< vapp::crypto::secret_key > executor;
  std::optional< vapp::crypto::secret_key > attester;
};

/*
 * Encoded public values of an empty step whose receipt count is replaced by `receipts`,
 * so that decoding asks for far more memory than the input could describe.
 */
std::vector< std::byte > public_values_claiming( std::uint64_t receipts );

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture() = default;

  static vapp::protocol::address address_of( const vapp::crypto::secret_key& key );

  vapp::protocol::transaction make_deposit( const vapp::protocol::address& account, const vapp::numeric::uint256& amount );
  vapp::protocol::transaction make_create_prover( const vapp::protocol::address& prover,
                                                  const vapp::protocol::address& owner,
                                                  const vapp::numeric::uint256& staker_fee_bips );
  vapp::protocol::transaction make_transfer( const vapp::crypto::secret_key& from,
                                             const vapp::protocol::address& to,
                                             const vapp::numeric::uint256& amount,
                                             const vapp::numeric::uint256& fee = 0 );
  vapp::protocol::transaction make_withdraw( const vapp::crypto::secret_key& signer,
                                             const vapp::protocol::address& account,
                                             const vapp::numeric::uint256& amount,
                                             const vapp::numeric::uint256& fee = 0 );
  vapp::protocol::transaction make_delegate( const vapp::crypto::secret_key& owner,
                                             const vapp::protocol::address& prover,
                                             const vapp::protocol::address& delegate,
                                             const vapp::numeric::uint256& fee = 0 );
  vapp::protocol::transaction make_clear( const vapp::crypto::secret_key& requester,
                                          const vapp::crypto::secret_key& bidder,
                                          const vapp::protocol::address& prover,
                                          const vapp::numeric::uint256& price,
                                          const clear_options& options = {} );

  std::uint64_t next_nonce() noexcept;

  vapp::numeric::uint256 balance( const vapp::protocol::address& account ) const;

  vapp::stf::result< vapp::stf::transition_input >
  make_input( const std::vector< vapp::protocol::transaction >& transactions ) const;

  /*
   * Proves a batch against the fixture state: builds the input, applies it and, on
   * success, commits the batch to the full state and records the step.
   */
  vapp::stf::result< vapp::stf::transition_output >
  apply( const std::vector< vapp::protocol::transaction >& transactions );

  std::optional< vapp::stf::prior_step > prior() const;

  vapp::crypto::digest _domain;
  vapp::verifier::vk_digest _vk;
  vapp::crypto::secret_key _auctioneer_key;
  vapp::crypto::secret_key _executor_key;
  vapp::crypto::secret_key _verifier_key;
  vapp::protocol::address _treasury;
  vapp::verifier::mock_verifier _verifier;
  vapp::stf::full_state _state;
  std::vector< std::vector< std::byte > > _steps;
  std::uint64_t _timestamp  = 1'000;
  std::uint64_t _onchain_tx = 1;
  std::uint64_t _block      = 1;
  std::uint64_t _log_index  = 0;
  std::uint64_t _nonce      = 1;
};

} // namespace test
