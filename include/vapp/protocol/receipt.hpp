#pragma once

#include <cstdint>
#include <limits>
#include <variant>

#include <vapp/protocol/serialization.hpp>
#include <vapp/protocol/transaction.hpp>

namespace vapp::protocol {

enum class transaction_status : std::uint8_t
{
  none = 0,
  completed,
  failed,
  reverted
};

template< typename Action >
struct onchain_receipt
{
  std::uint64_t onchain_tx_id = 0;
  transaction_status status   = transaction_status::none;
  Action action;

  bool operator==( const onchain_receipt& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & onchain_tx_id;
    ar & status;
    ar & action;
  }
};

template< typename Action >
struct offchain_receipt
{
  transaction_status status = transaction_status::none;
  Action action;

  bool operator==( const offchain_receipt& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & status;
    ar & action;
  }
};

// Receipts are the follow-up actions the settlement contract acts on.
using receipt = std::variant< onchain_receipt< deposit >, onchain_receipt< create_prover >, offchain_receipt< withdraw > >;

// Off-chain receipts are reported with no on-chain transaction id.
constexpr std::uint64_t offchain_tx_id = std::numeric_limits< std::uint64_t >::max();

std::uint64_t onchain_tx_id( const receipt& r ) noexcept;

} // namespace vapp::protocol
