#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include <vapp/crypto/hash.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/protocol/message.hpp>
#include <vapp/protocol/serialization.hpp>

namespace vapp::protocol {

struct deposit
{
  address account;
  numeric::uint256 amount;

  bool operator==( const deposit& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

struct create_prover
{
  address prover;
  address owner;
  numeric::uint256 staker_fee_bips;

  bool operator==( const create_prover& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & prover;
    ar & owner;
    ar & staker_fee_bips;
  }
};

struct withdraw
{
  address account;
  numeric::uint256 amount;

  bool operator==( const withdraw& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

// An event emitted by the settlement contract, positioned by block and log index.
template< typename Action >
struct onchain_transaction
{
  std::optional< crypto::digest > tx_hash;
  std::uint64_t block      = 0;
  std::uint64_t log_index  = 0;
  std::uint64_t onchain_tx = 0;
  Action action;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & tx_hash;
    ar & block;
    ar & log_index;
    ar & onchain_tx;
    ar & action;
  }
};

struct delegate_transaction
{
  signed_message< delegate_body > delegation;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & delegation;
  }
};

struct transfer_transaction
{
  signed_message< transfer_body > transfer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & transfer;
  }
};

struct withdraw_transaction
{
  signed_message< withdraw_body > withdrawal;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & withdrawal;
  }
};

// Settles one proof request: the request, winning bid, settlement, execution and fulfillment.
struct clear_transaction
{
  signed_message< request_body > request;
  signed_message< bid_body > bid;
  signed_message< settle_body > settle;
  signed_message< execute_body > execute;
  std::optional< signed_message< fulfill_body > > fulfill;
  std::optional< attestation > verify;
  std::optional< raw_bytes > vk;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & request;
    ar & bid;
    ar & settle;
    ar & execute;
    ar & fulfill;
    ar & verify;
    ar & vk;
  }
};

using transaction = std::variant< onchain_transaction< deposit >,
                                  withdraw_transaction,
                                  onchain_transaction< create_prover >,
                                  delegate_transaction,
                                  transfer_transaction,
                                  clear_transaction >;

} // namespace vapp::protocol
